/**
 * @file ValidationReport.hpp
 * @brief Turns the buckets of a finished pass into a verdict and a report.
 */

#pragma once

#include <optional>
#include <string>
#include "application/ValidationContext.hpp"
#include "domain/ValidationResult.hpp"

namespace symbolgate::application {

/**
 * @struct ValidationSnapshot
 * @brief Immutable published state: verdict plus the optional report text.
 */
struct ValidationSnapshot {
    domain::SymbolValidationResult result = domain::SymbolValidationResult::Pending;
    std::optional<std::string> errorMessage;

    bool operator==(const ValidationSnapshot& other) const {
        return result == other.result && errorMessage == other.errorMessage;
    }
    bool operator!=(const ValidationSnapshot& other) const { return !(*this == other); }
};

class ValidationReport {
public:
    static constexpr const char* kNothingToValidateMessage = "No files found to validate";

    /**
     * @brief Computes the verdict from the final bucket contents.
     *
     * Missing symbols outrank source-link errors, which outrank missing source link. The
     * report always lists every non-empty bucket in the order: missing source link,
     * source-link errors, missing symbols.
     */
    static ValidationSnapshot Aggregate(const ValidationContext& context);
};

} // namespace symbolgate::application
