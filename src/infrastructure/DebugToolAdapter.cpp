/**
 * @file DebugToolAdapter.cpp
 * @brief Implementation of DebugToolAdapter.
 */

#include "infrastructure/DebugToolAdapter.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/TemporaryFile.hpp"
#include <iostream>
#include <stdexcept>

namespace symbolgate::infrastructure {

using json = nlohmann::json;

DebugToolAdapter::DebugToolAdapter(const std::string& command, const std::string& tempDirectory)
    : m_command(command), m_tempDirectory(tempDirectory) {}

std::string DebugToolAdapter::run(const std::string& arguments) const {
    std::string cmd = m_command + " " + arguments + " 2>/dev/null";
    auto result = ProcessRunner::Run(cmd);

    if (result.exitCode == kFormatErrorExitCode) {
        throw domain::DebugDataFormatError("Debug reader rejected the debug data: " + arguments);
    }
    if (result.exitCode != 0) {
        throw std::runtime_error("Debug reader '" + m_command + "' exited with code " + std::to_string(result.exitCode));
    }
    return result.output;
}

std::optional<domain::AssemblyMetadata> DebugToolAdapter::readFromFile(const std::string& path) {
    return ParseMetadata(run("metadata " + ProcessRunner::Quote(path)));
}

domain::DebugData DebugToolAdapter::readDebugData(std::istream& peStream, std::istream& pdbStream) {
    TemporaryFile pe(peStream, ".dll", m_tempDirectory);
    TemporaryFile pdb(pdbStream, ".pdb", m_tempDirectory);

    std::string output = run("pdb " + ProcessRunner::Quote(pe.fileName()) + " " + ProcessRunner::Quote(pdb.fileName()));
    try {
        return ParseDebugData(json::parse(output));
    } catch (const json::exception& e) {
        throw domain::DebugDataFormatError(std::string("Unreadable debug reader output: ") + e.what());
    }
}

std::optional<domain::AssemblyMetadata> DebugToolAdapter::ParseMetadata(const std::string& output) {
    json j;
    try {
        j = json::parse(output);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Unreadable debug reader output: ") + e.what());
    }
    if (j.is_null()) {
        return std::nullopt;
    }

    domain::AssemblyMetadata metadata;
    metadata.assemblyName = j.value("assemblyName", "");
    if (j.contains("debugData") && j["debugData"].is_object()) {
        metadata.debugData = ParseDebugData(j["debugData"]);
    }
    return metadata;
}

domain::DebugData DebugToolAdapter::ParseDebugData(const json& j) {
    if (!j.is_object()) {
        throw domain::DebugDataFormatError("Debug data is not an object");
    }

    domain::DebugData data;
    data.hasDebugInfo = j.value("hasDebugInfo", false);
    data.hasSourceLink = j.value("hasSourceLink", false);

    if (j.contains("sourceLinkErrors") && j["sourceLinkErrors"].is_array()) {
        for (const auto& error : j["sourceLinkErrors"]) {
            if (error.is_string()) {
                data.sourceLinkErrors.push_back(error.get<std::string>());
            }
        }
    }

    if (j.contains("symbolKeys") && j["symbolKeys"].is_array()) {
        for (const auto& item : j["symbolKeys"]) {
            if (!item.is_object() || !item.contains("key") || !item["key"].is_string()) continue;
            domain::SymbolKey key;
            key.key = item["key"].get<std::string>();
            if (item.contains("checksums") && item["checksums"].is_array()) {
                for (const auto& checksum : item["checksums"]) {
                    if (checksum.is_string()) key.checksums.push_back(checksum.get<std::string>());
                }
            }
            data.symbolKeys.push_back(std::move(key));
        }
    }
    return data;
}

} // namespace symbolgate::infrastructure
