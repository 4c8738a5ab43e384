/**
 * @file SymbolGateApp.hpp
 * @brief Command line front end for SymbolGate.
 */

#pragma once

#include <optional>
#include <string>

namespace symbolgate::app {

/**
 * @class SymbolGateApp
 * @brief Opens a package, runs one validation pass and prints the verdict.
 */
class SymbolGateApp {
public:
    static constexpr int kUsageError = 2;

    /**
     * @brief Runs the application.
     * @return 0 if the package is valid (or has nothing to validate), 1 for a failing verdict,
     * 2 for usage or I/O errors.
     */
    int Run(int argc, char** argv);

private:
    bool ParseArguments(int argc, char** argv);
    void PrintUsage(const char* program) const;

    std::string m_packagePath; ///< .nupkg to validate.
    std::optional<std::string> m_configPath; ///< Explicit settings.json, if given.
};

} // namespace symbolgate::app
