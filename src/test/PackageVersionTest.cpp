#include <cassert>
#include <iostream>

#include "domain/Package.hpp"
#include "domain/PackageVersion.hpp"

using symbolgate::domain::NormalizeVersion;
using symbolgate::domain::RepositorySignature;

int main() {
    std::cout << "[Test] Starting PackageVersion Test..." << std::endl;

    assert(NormalizeVersion("1.0.0") == "1.0.0");
    assert(NormalizeVersion("1.0") == "1.0.0");
    assert(NormalizeVersion("3") == "3.0.0");
    assert(NormalizeVersion("01.2") == "1.2.0");
    assert(NormalizeVersion("1.00.007") == "1.0.7");
    assert(NormalizeVersion("1.0.0.0") == "1.0.0");
    assert(NormalizeVersion("1.2.3.4") == "1.2.3.4");
    assert(NormalizeVersion("2.1.0-Beta+sha.1") == "2.1.0-Beta");
    assert(NormalizeVersion("6.0.0-preview.7.21377.19") == "6.0.0-preview.7.21377.19");
    assert(NormalizeVersion("  4.5.1  ") == "4.5.1");
    std::cout << "[PASS] Numeric versions normalized." << std::endl;

    assert(NormalizeVersion("latest") == "latest");
    assert(NormalizeVersion("1.x") == "1.x");
    assert(NormalizeVersion("1.2.3.4.5") == "1.2.3.4.5");
    assert(NormalizeVersion("").empty());
    std::cout << "[PASS] Non-numeric versions left alone." << std::endl;

    assert(RepositorySignature{"https://api.nuget.org/v3/index.json"}.serviceIndexHost() == "api.nuget.org");
    assert(RepositorySignature{"HTTPS://User@API.NuGet.org:443/v3/index.json"}.serviceIndexHost() == "api.nuget.org");
    assert(RepositorySignature{"https://nuget.org?x=1"}.serviceIndexHost() == "nuget.org");
    assert(RepositorySignature{"api.nuget.org/v3/index.json"}.serviceIndexHost().empty());
    std::cout << "[PASS] Service index hosts." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
