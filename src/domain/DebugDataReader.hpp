/**
 * @file DebugDataReader.hpp
 * @brief Interface for reading debug information from modules and PDBs.
 */

#pragma once
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include "DebugData.hpp"

namespace symbolgate::domain {

/**
 * @class DebugDataFormatError
 * @brief Raised when a PDB or embedded debug directory has an unexpected shape.
 */
class DebugDataFormatError : public std::runtime_error {
public:
    explicit DebugDataFormatError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class DebugDataReader
 * @brief Abstract reader for module metadata and debug data.
 */
class DebugDataReader {
public:
    virtual ~DebugDataReader() = default;

    /**
     * @brief Reads module metadata, including embedded debug data, from a file on disk.
     * @param path Path to a seekable copy of the module.
     * @return Metadata, or nullopt if the file is not a readable module.
     */
    virtual std::optional<AssemblyMetadata> readFromFile(const std::string& path) = 0;

    /**
     * @brief Reads debug data from a module and its separate PDB.
     * @param peStream Seekable module stream.
     * @param pdbStream Seekable PDB stream.
     * @throws DebugDataFormatError on a malformed or ambiguous PDB.
     */
    virtual DebugData readDebugData(std::istream& peStream, std::istream& pdbStream) = 0;
};

} // namespace symbolgate::domain
