/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace symbolgate::infrastructure {

std::filesystem::path ConfigLoader::DefaultConfigPath() {
    return PathUtils::GetConfigHome() / "SymbolGate" / "settings.json";
}

AppConfig ConfigLoader::Load(const std::optional<std::string>& explicitPath) {
    if (explicitPath) {
        return Load(std::filesystem::path(*explicitPath));
    }
    return Load(DefaultConfigPath());
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("debug_reader_command") && j["debug_reader_command"].is_string()) {
            config.debugReaderCommand = j["debug_reader_command"].get<std::string>();
        }
        if (j.contains("signature_tool") && j["signature_tool"].is_string()) {
            config.signatureTool = j["signature_tool"].get<std::string>();
        }
        if (j.contains("http_timeout_seconds") && j["http_timeout_seconds"].is_number_integer()) {
            int timeout = j["http_timeout_seconds"].get<int>();
            if (timeout > 0) config.httpTimeoutSeconds = timeout;
        }
        if (j.contains("temp_directory") && j["temp_directory"].is_string()) {
            config.tempDirectory = j["temp_directory"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return AppConfig{};
    }

    return config;
}

} // namespace symbolgate::infrastructure
