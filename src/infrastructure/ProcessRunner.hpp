/**
 * @file ProcessRunner.hpp
 * @brief Runs external tools through the shell and captures their output.
 */

#pragma once
#include <string>

namespace symbolgate::infrastructure {

class ProcessRunner {
public:
    struct Result {
        int exitCode = -1; ///< -1 when the process could not be started or did not exit normally.
        std::string output;
    };

    /** @brief Runs a shell command and returns its stdout. */
    static Result Run(const std::string& command);

    /** @brief Checks whether a tool is on PATH. */
    static bool HasTool(const std::string& tool);

    /** @brief Quotes an argument for /bin/sh. */
    static std::string Quote(const std::string& arg);
};

} // namespace symbolgate::infrastructure
