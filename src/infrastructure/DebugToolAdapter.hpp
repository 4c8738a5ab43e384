/**
 * @file DebugToolAdapter.hpp
 * @brief DebugDataReader that delegates to an external debug-info tool.
 *
 * The tool is invoked as
 *   <command> metadata <binary>        -> AssemblyMetadata JSON, or `null`
 *   <command> pdb <binary> <pdb>       -> DebugData JSON
 * and exits with code 3 when the debug data is malformed.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/DebugDataReader.hpp"

namespace symbolgate::infrastructure {

class DebugToolAdapter : public domain::DebugDataReader {
public:
    static constexpr int kFormatErrorExitCode = 3;

    DebugToolAdapter(const std::string& command, const std::string& tempDirectory);

    std::optional<domain::AssemblyMetadata> readFromFile(const std::string& path) override;
    domain::DebugData readDebugData(std::istream& peStream, std::istream& pdbStream) override;

    /** @brief Parses the output of the `metadata` verb. */
    static std::optional<domain::AssemblyMetadata> ParseMetadata(const std::string& output);

    /** @brief Converts a DebugData JSON object. */
    static domain::DebugData ParseDebugData(const nlohmann::json& j);

private:
    std::string run(const std::string& arguments) const;

    std::string m_command;
    std::string m_tempDirectory;
};

} // namespace symbolgate::infrastructure
