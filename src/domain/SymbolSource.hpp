/**
 * @file SymbolSource.hpp
 * @brief Interface for remote sources of symbol data.
 */

#pragma once
#include <optional>
#include <string>
#include "CancellationToken.hpp"
#include "DebugData.hpp"

namespace symbolgate::domain {

/** @brief Raw bytes of a downloaded artifact. */
using Blob = std::string;

/**
 * @class SymbolSource
 * @brief Best-effort remote lookup. Returns nullopt whenever the artifact cannot be retrieved.
 */
class SymbolSource {
public:
    virtual ~SymbolSource() = default;

    /**
     * @brief Fetches the artifact identified by a key.
     * @param key Lookup path relative to the source's endpoint, plus optional checksums.
     * @param token Aborts the request when cancelled.
     */
    virtual std::optional<Blob> fetch(const SymbolKey& key, const CancellationToken& token) = 0;

    /** @brief Name used in log lines. */
    virtual std::string name() const = 0;
};

} // namespace symbolgate::domain
