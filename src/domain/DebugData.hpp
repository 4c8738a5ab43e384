/**
 * @file DebugData.hpp
 * @brief Debug information facts extracted from a binary or its PDB.
 */

#pragma once
#include <string>
#include <vector>

namespace symbolgate::domain {

/**
 * @struct SymbolKey
 * @brief Lookup path for a symbol file on a symbol server.
 */
struct SymbolKey {
    std::string key;                    ///< Relative path, e.g. "foo.pdb/<guid><age>/foo.pdb".
    std::vector<std::string> checksums; ///< Optional PDB checksums ("SHA256:...").
};

/**
 * @struct DebugData
 * @brief What the debug data reader found for one module.
 */
struct DebugData {
    bool hasDebugInfo = false;
    bool hasSourceLink = false;
    std::vector<std::string> sourceLinkErrors;
    std::vector<SymbolKey> symbolKeys;
};

/**
 * @struct AssemblyMetadata
 * @brief Module-level metadata returned when reading a binary from disk.
 */
struct AssemblyMetadata {
    std::string assemblyName;
    DebugData debugData;
};

} // namespace symbolgate::domain
