#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "app/ConsoleFormatting.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpSymbolSource.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace symbolgate::infrastructure;
using symbolgate::domain::SymbolValidationResult;

namespace fs = std::filesystem;

namespace {
void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}
}

static void testConfig() {
    std::cout << "[Test] Loading settings.json..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "symbolgate_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    AppConfig defaults = ConfigLoader::Load(dir / "missing.json");
    assert(defaults.debugReaderCommand == "symbolgate-debuginfo");
    assert(defaults.signatureTool == "osslsigncode");
    assert(defaults.httpTimeoutSeconds == 60);
    assert(defaults.tempDirectory.empty());

    WriteFile(dir / "settings.json", R"({
        "debug_reader_command": "dotnet /opt/debuginfo/debuginfo.dll",
        "http_timeout_seconds": 15,
        "temp_directory": "/var/tmp/symbolgate",
        "unknown_key": true
    })");
    AppConfig config = ConfigLoader::Load(std::optional<std::string>((dir / "settings.json").string()));
    assert(config.debugReaderCommand == "dotnet /opt/debuginfo/debuginfo.dll");
    assert(config.signatureTool == "osslsigncode");
    assert(config.httpTimeoutSeconds == 15);
    assert(config.tempDirectory == "/var/tmp/symbolgate");

    WriteFile(dir / "wrong_types.json", R"({"http_timeout_seconds": "fast", "signature_tool": 3})");
    config = ConfigLoader::Load(dir / "wrong_types.json");
    assert(config.httpTimeoutSeconds == 60);
    assert(config.signatureTool == "osslsigncode");

    WriteFile(dir / "broken.json", "{ \"signature_tool\": ");
    config = ConfigLoader::Load(dir / "broken.json");
    assert(config.signatureTool == "osslsigncode");

    setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    assert(ConfigLoader::DefaultConfigPath() == dir / "SymbolGate" / "settings.json");

    fs::path preferred = dir / "scratch";
    assert(PathUtils::GetTempDirectory(preferred.string()) == preferred);
    assert(fs::is_directory(preferred));
    assert(PathUtils::GetTempDirectory("") == fs::temp_directory_path());

    fs::remove_all(dir);
    std::cout << "[PASS] Defaults overlaid by valid keys only." << std::endl;
}

static void testHttpSource() {
    std::cout << "[Test] Symbol source request handling..." << std::endl;

    assert(HttpSymbolSource::FormatChecksumHeader({}).empty());
    assert(HttpSymbolSource::FormatChecksumHeader({"SHA256:AA"}) == "SHA256:AA");
    assert(HttpSymbolSource::FormatChecksumHeader({"SHA256:AA", "SHA256:BB"}) == "SHA256:AA;SHA256:BB");

    symbolgate::domain::CancellationToken cancelled;
    cancelled.cancel();
    HttpSymbolSource source("local", "http://127.0.0.1:1", "/symbols/", 1);
    assert(!source.fetch({"a.pdb/1/a.pdb", {}}, cancelled));

    symbolgate::domain::CancellationToken live;
    assert(!source.fetch({"a.pdb/1/a.pdb", {"SHA256:AA"}}, live));

    assert(HttpSymbolSource::CreateRegistrySymbolPackageSource()->name() == "nuget.org symbol packages");
    assert(HttpSymbolSource::CreatePlatformSymbolServerSource(5)->name() == "Microsoft symbol server");
    std::cout << "[PASS] Failures surface as absent results." << std::endl;
}

static void testConsoleFormatting() {
    std::cout << "[Test] Console formatting..." << std::endl;
    using symbolgate::app::ShortenMiddle;

    assert(ShortenMiddle("short", 10) == "short");
    assert(ShortenMiddle("abcdefghij", 10) == "abcdefghij");
    assert(ShortenMiddle("abcdefghijk", 10) == "abc...hijk");
    assert(ShortenMiddle("abcdefghijk", 5) == "a...k");

    bool threw = false;
    try {
        ShortenMiddle("abcdefghijk", 4);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    assert(symbolgate::app::ExitCodeFor(SymbolValidationResult::Valid) == 0);
    assert(symbolgate::app::ExitCodeFor(SymbolValidationResult::ValidExternal) == 0);
    assert(symbolgate::app::ExitCodeFor(SymbolValidationResult::NothingToValidate) == 0);
    assert(symbolgate::app::ExitCodeFor(SymbolValidationResult::NoSymbols) == 1);
    assert(symbolgate::app::ExitCodeFor(SymbolValidationResult::Pending) == 1);
    std::cout << "[PASS] Middle ellipsis and exit codes." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    testConfig();
    testHttpSource();
    testConsoleFormatting();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
