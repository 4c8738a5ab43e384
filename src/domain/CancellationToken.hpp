/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a pass and its network calls.
 */

#pragma once
#include <atomic>

namespace symbolgate::domain {

class CancellationToken {
public:
    void cancel() { m_cancelled = true; }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace symbolgate::domain
