#include <cassert>
#include <iostream>
#include <sstream>

#include "application/ValidationReport.hpp"

using namespace symbolgate::application;
using symbolgate::domain::SymbolValidationResult;

namespace {

class NamedFile : public symbolgate::domain::PackageFile {
public:
    explicit NamedFile(std::string path) : m_path(std::move(path)) {}
    const std::string& path() const override { return m_path; }
    std::unique_ptr<std::istream> openStream() const override { return std::make_unique<std::istringstream>(""); }
    std::vector<std::shared_ptr<PackageFile>> getAssociatedFiles() const override { return {}; }

private:
    std::string m_path;
};

std::shared_ptr<symbolgate::domain::PackageFile> File(const std::string& path) {
    return std::make_shared<NamedFile>(path);
}

ValidationContext ContextWith(std::initializer_list<std::string> candidates) {
    ValidationContext context;
    for (const auto& path : candidates) {
        context.filesWithPdb.push_back({File(path), nullptr});
    }
    return context;
}

}

static void testNothingToValidate() {
    std::cout << "[Test] Empty candidate list..." << std::endl;
    ValidationContext context;
    auto snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::NothingToValidate);
    assert(snapshot.errorMessage && *snapshot.errorMessage == "No files found to validate");
    std::cout << "[PASS] NothingToValidate." << std::endl;
}

static void testValidVerdicts() {
    std::cout << "[Test] Clean buckets..." << std::endl;
    auto context = ContextWith({"lib\\a.dll"});
    auto snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::Valid);
    assert(!snapshot.errorMessage);

    context.requireExternal = true;
    snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::ValidExternal);
    assert(!snapshot.errorMessage);
    std::cout << "[PASS] Valid and ValidExternal." << std::endl;
}

static void testSingleBuckets() {
    std::cout << "[Test] One non-empty bucket at a time..." << std::endl;

    auto context = ContextWith({"lib\\a.dll", "lib\\b.dll"});
    context.noSourceLink = {File("lib\\a.dll"), File("lib\\b.dll")};
    auto snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::NoSourceLink);
    assert(*snapshot.errorMessage == "Missing Source Link for:\nlib\\a.dll\nlib\\b.dll\n");

    context = ContextWith({"lib\\a.dll"});
    context.sourceLinkErrors.push_back({File("lib\\a.dll"), "Unmapped document src\\x.cs\nUnmapped document src\\y.cs"});
    snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::InvalidSourceLink);
    assert(*snapshot.errorMessage ==
           "Source Link errors for lib\\a.dll:\nUnmapped document src\\x.cs\nUnmapped document src\\y.cs\n");

    context = ContextWith({"lib\\a.dll"});
    context.noSymbols.push_back({File("lib\\a.dll"), std::nullopt});
    snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::NoSymbols);
    assert(*snapshot.errorMessage == "Missing Symbols for:\nlib\\a.dll\n");

    std::cout << "[PASS] Single-bucket reports." << std::endl;
}

static void testPrecedenceAndLayout() {
    std::cout << "[Test] All buckets populated..." << std::endl;

    auto context = ContextWith({"lib\\a.dll", "lib\\b.dll", "lib\\c.dll"});
    context.noSourceLink = {File("lib\\a.dll")};
    context.sourceLinkErrors.push_back({File("lib\\b.dll"), "bad url"});
    context.noSymbols.push_back({File("lib\\c.dll"), std::nullopt});
    context.requireExternal = true;

    auto snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::NoSymbols);
    assert(*snapshot.errorMessage ==
           "Missing Source Link for:\nlib\\a.dll\n"
           "\n"
           "Source Link errors for lib\\b.dll:\nbad url\n"
           "\n"
           "Missing Symbols for:\nlib\\c.dll\n");

    context.noSymbols.clear();
    snapshot = ValidationReport::Aggregate(context);
    assert(snapshot.result == SymbolValidationResult::InvalidSourceLink);
    assert(*snapshot.errorMessage ==
           "Missing Source Link for:\nlib\\a.dll\n"
           "\n"
           "Source Link errors for lib\\b.dll:\nbad url\n");

    std::cout << "[PASS] Missing symbols outrank source-link errors, which outrank missing source link." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ValidationReport Test..." << std::endl;
    testNothingToValidate();
    testValidVerdicts();
    testSingleBuckets();
    testPrecedenceAndLayout();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
