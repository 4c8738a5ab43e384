#include "application/ValidationReport.hpp"
#include <sstream>

namespace symbolgate::application {

namespace {

template<typename T, typename PathOf>
std::string JoinPaths(const std::vector<T>& items, PathOf pathOf) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += "\n";
        joined += pathOf(item);
    }
    return joined;
}

} // namespace

ValidationSnapshot ValidationReport::Aggregate(const ValidationContext& context) {
    using domain::SymbolValidationResult;
    ValidationSnapshot snapshot;

    if (context.filesWithPdb.empty()) {
        snapshot.result = SymbolValidationResult::NothingToValidate;
        snapshot.errorMessage = kNothingToValidateMessage;
        return snapshot;
    }

    if (context.noSymbols.empty() && context.noSourceLink.empty() && context.sourceLinkErrors.empty()) {
        snapshot.result = context.requireExternal ? SymbolValidationResult::ValidExternal
                                                  : SymbolValidationResult::Valid;
        snapshot.errorMessage = std::nullopt;
        return snapshot;
    }

    std::ostringstream report;
    bool found = false;

    if (!context.noSourceLink.empty()) {
        report << "Missing Source Link for:\n"
               << JoinPaths(context.noSourceLink, [](const auto& f) { return f->path(); }) << "\n";
        found = true;
    }

    if (!context.sourceLinkErrors.empty()) {
        if (found) report << "\n";
        for (const auto& failure : context.sourceLinkErrors) {
            report << "Source Link errors for " << failure.file->path() << ":\n" << failure.errors << "\n";
        }
        found = true;
    }

    if (!context.noSymbols.empty()) {
        if (found) report << "\n";
        report << "Missing Symbols for:\n"
               << JoinPaths(context.noSymbols, [](const auto& f) { return f.file->path(); }) << "\n";
    }

    if (!context.noSymbols.empty()) {
        snapshot.result = SymbolValidationResult::NoSymbols;
    } else if (!context.sourceLinkErrors.empty()) {
        snapshot.result = SymbolValidationResult::InvalidSourceLink;
    } else {
        snapshot.result = SymbolValidationResult::NoSourceLink;
    }
    snapshot.errorMessage = report.str();
    return snapshot;
}

} // namespace symbolgate::application
