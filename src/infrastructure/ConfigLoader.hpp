/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place. Missing keys fall back to defaults.
 */

#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace symbolgate::infrastructure {

/**
 * @struct AppConfig
 * @brief Tunables of the validator. Symbol endpoints are fixed and not part of the config.
 */
struct AppConfig {
    std::string debugReaderCommand = "symbolgate-debuginfo";
    std::string signatureTool = "osslsigncode";
    int httpTimeoutSeconds = 60;
    std::string tempDirectory; ///< Empty means the system temp directory.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a file.
     * @param configPath Path to settings.json.
     * @return Defaults overlaid with the keys present in the file. Unreadable files yield defaults.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /**
     * @brief Reads settings from the explicit path if given, else from the user config directory.
     */
    static AppConfig Load(const std::optional<std::string>& explicitPath);

    /** @brief $XDG_CONFIG_HOME/SymbolGate/settings.json */
    static std::filesystem::path DefaultConfigPath();
};

} // namespace symbolgate::infrastructure
