#include "app/ConsoleFormatting.hpp"
#include <stdexcept>

namespace symbolgate::app {

std::string ShortenMiddle(const std::string& text, std::size_t maxLength) {
    if (maxLength < 5) {
        throw std::out_of_range("maxLength must be at least 5");
    }
    if (text.size() <= maxLength) {
        return text;
    }

    std::size_t prefixLength = (maxLength - 3) / 2;
    std::size_t suffixLength = maxLength - 3 - prefixLength;
    return text.substr(0, prefixLength) + "..." + text.substr(text.size() - suffixLength);
}

std::string DescribeResult(domain::SymbolValidationResult result) {
    using domain::SymbolValidationResult;
    switch (result) {
        case SymbolValidationResult::Valid: return "Valid: symbols and Source Link present";
        case SymbolValidationResult::ValidExternal: return "Valid: symbols retrieved from a symbol server";
        case SymbolValidationResult::InvalidSourceLink: return "Invalid: Source Link has errors";
        case SymbolValidationResult::NoSourceLink: return "Invalid: Source Link missing";
        case SymbolValidationResult::NoSymbols: return "Invalid: symbols missing";
        case SymbolValidationResult::Pending: return "Pending";
        case SymbolValidationResult::NothingToValidate: return "Nothing to validate";
    }
    return "Pending";
}

int ExitCodeFor(domain::SymbolValidationResult result) {
    using domain::SymbolValidationResult;
    switch (result) {
        case SymbolValidationResult::Valid:
        case SymbolValidationResult::ValidExternal:
        case SymbolValidationResult::NothingToValidate:
            return 0;
        default:
            return 1;
    }
}

} // namespace symbolgate::app
