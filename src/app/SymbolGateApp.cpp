/**
 * @file SymbolGateApp.cpp
 * @brief Implementation of the SymbolGateApp class.
 */

#include "app/SymbolGateApp.hpp"
#include "app/ConsoleFormatting.hpp"
#include "application/SymbolValidator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ConsoleDiagnostics.hpp"
#include "infrastructure/DebugToolAdapter.hpp"
#include "infrastructure/HttpSymbolSource.hpp"
#include "infrastructure/OsslSigncodeInspector.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/ZipPackage.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace symbolgate::app {

namespace {
constexpr std::size_t kPathColumnWidth = 60;
constexpr int kProgressIntervalMs = 500;

std::string FirstWord(const std::string& command) {
    std::istringstream in(command);
    std::string word;
    in >> word;
    return word;
}
}

bool SymbolGateApp::ParseArguments(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) return false;
            m_configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (m_packagePath.empty()) {
            m_packagePath = arg;
        } else {
            return false;
        }
    }
    return !m_packagePath.empty();
}

void SymbolGateApp::PrintUsage(const char* program) const {
    std::cerr << "Usage: " << program << " <package.nupkg> [--config <settings.json>]\n"
              << "Checks that the binaries of a package ship symbols with Source Link.\n";
}

int SymbolGateApp::Run(int argc, char** argv) {
    if (!ParseArguments(argc, argv)) {
        PrintUsage(argc > 0 ? argv[0] : "symbolgate");
        return kUsageError;
    }

    auto config = infrastructure::ConfigLoader::Load(m_configPath);
    std::string tempDirectory = infrastructure::PathUtils::GetTempDirectory(config.tempDirectory).string();

    std::shared_ptr<infrastructure::ZipPackage> package;
    try {
        package = infrastructure::ZipPackage::Open(m_packagePath);
    } catch (const std::exception& e) {
        std::cerr << "[SymbolGate] Cannot open " << m_packagePath << ": " << e.what() << std::endl;
        return kUsageError;
    }

    if (!infrastructure::ProcessRunner::HasTool(FirstWord(config.debugReaderCommand))) {
        std::cerr << "[SymbolGate] Debug reader '" << config.debugReaderCommand
                  << "' not found; binaries will be reported without symbols" << std::endl;
    }
    if (!infrastructure::ProcessRunner::HasTool(config.signatureTool)) {
        std::cerr << "[SymbolGate] Signature tool '" << config.signatureTool
                  << "' not found; the platform symbol server will not be queried" << std::endl;
    }

    application::SymbolValidator::Dependencies deps;
    deps.debugReader = std::make_shared<infrastructure::DebugToolAdapter>(config.debugReaderCommand, tempDirectory);
    deps.signatureInspector = std::make_shared<infrastructure::OsslSigncodeInspector>(config.signatureTool);
    deps.registrySource = infrastructure::HttpSymbolSource::CreateRegistrySymbolPackageSource(config.httpTimeoutSeconds);
    deps.platformSource = infrastructure::HttpSymbolSource::CreatePlatformSymbolServerSource(config.httpTimeoutSeconds);
    deps.diagnostics = std::make_shared<infrastructure::ConsoleDiagnostics>();
    deps.taskManager = std::make_shared<application::AsyncTaskManager>();
    deps.tempDirectory = tempDirectory;

    std::cout << "Package: " << ShortenMiddle(m_packagePath, kPathColumnWidth) << "\n"
              << "Id:      " << package->id() << " " << package->normalizedVersion() << std::endl;

    application::SymbolValidator validator(package, deps);
    auto status = validator.refresh();
    bool showedProgress = false;
    while (!deps.taskManager->WaitIdleFor(std::chrono::milliseconds(kProgressIntervalMs))) {
        std::cerr << "[SymbolGate] Validating... " << static_cast<int>(status->progress.load() * 100) << "%" << std::endl;
        showedProgress = true;
    }
    if (showedProgress) {
        std::cerr << "[SymbolGate] Validation finished" << std::endl;
    }

    auto snapshot = validator.getSnapshot();
    std::cout << "Result:  " << DescribeResult(snapshot.result) << std::endl;
    if (snapshot.errorMessage) {
        std::cout << "\n" << *snapshot.errorMessage;
    }
    return ExitCodeFor(snapshot.result);
}

} // namespace symbolgate::app
