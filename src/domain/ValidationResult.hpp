/**
 * @file ValidationResult.hpp
 * @brief Verdict of a symbol validation pass.
 */

#pragma once
#include <string>

namespace symbolgate::domain {

/**
 * @enum SymbolValidationResult
 * @brief Overall outcome for a package. Pending until a pass completes.
 */
enum class SymbolValidationResult {
    Valid,
    ValidExternal,
    InvalidSourceLink,
    NoSourceLink,
    NoSymbols,
    Pending,
    NothingToValidate
};

inline std::string ToString(SymbolValidationResult result) {
    switch (result) {
        case SymbolValidationResult::Valid: return "Valid";
        case SymbolValidationResult::ValidExternal: return "ValidExternal";
        case SymbolValidationResult::InvalidSourceLink: return "InvalidSourceLink";
        case SymbolValidationResult::NoSourceLink: return "NoSourceLink";
        case SymbolValidationResult::NoSymbols: return "NoSymbols";
        case SymbolValidationResult::Pending: return "Pending";
        case SymbolValidationResult::NothingToValidate: return "NothingToValidate";
    }
    return "Pending";
}

} // namespace symbolgate::domain
