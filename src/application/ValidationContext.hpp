/**
 * @file ValidationContext.hpp
 * @brief Working state of a single validation pass.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "domain/DebugData.hpp"
#include "domain/Package.hpp"

namespace symbolgate::application {

/**
 * @struct FileWithPdb
 * @brief A candidate binary and its co-located PDB, if the package carries one.
 */
struct FileWithPdb {
    std::shared_ptr<domain::PackageFile> primary;
    std::shared_ptr<domain::PackageFile> pdb;
};

/**
 * @struct FileWithDebugData
 * @brief A binary whose symbols were not found locally, with whatever debug data was read.
 */
struct FileWithDebugData {
    std::shared_ptr<domain::PackageFile> file;
    std::optional<domain::DebugData> debugData;
};

struct SourceLinkFailure {
    std::shared_ptr<domain::PackageFile> file;
    std::string errors; ///< Error strings joined with '\n'.
};

/** @brief Debug data was read; source-link checks apply. */
struct Inspected {
    domain::DebugData debugData;
};

/** @brief Debug data exists but could not be interpreted. Counts as missing source link. */
struct Degraded {
    std::string reason;
};

/** @brief No debug data available locally. Partial data may still carry symbol keys. */
struct Unavailable {
    std::optional<domain::DebugData> partial;
};

using DebugOutcome = std::variant<Inspected, Degraded, Unavailable>;

/**
 * @struct ValidationContext
 * @brief Buckets filled during one pass. Owned by the pass, never shared.
 */
struct ValidationContext {
    std::vector<FileWithPdb> filesWithPdb;
    std::vector<std::shared_ptr<domain::PackageFile>> noSourceLink;
    std::vector<SourceLinkFailure> sourceLinkErrors;
    std::vector<FileWithDebugData> noSymbols;
    bool requireExternal = false;
};

} // namespace symbolgate::application
