/**
 * @file DiagnosticsSink.hpp
 * @brief Receiver for unexpected faults that escape a validation pass.
 */

#pragma once
#include <exception>
#include <string>

namespace symbolgate::domain {

class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    /**
     * @brief Records an exception.
     * @param context Short description of the operation that failed.
     */
    virtual void trackException(const std::exception& e, const std::string& context) = 0;
};

} // namespace symbolgate::domain
