/**
 * @file Package.hpp
 * @brief Read-only view of a package's file tree and provenance.
 */

#pragma once
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace symbolgate::domain {

/**
 * @class PackageFile
 * @brief A file entry inside a package. Paths are relative and use '\' separators.
 */
class PackageFile {
public:
    virtual ~PackageFile() = default;

    virtual const std::string& path() const = 0;

    /** @brief Opens a fresh stream over the file content. May not be seekable. */
    virtual std::unique_ptr<std::istream> openStream() const = 0;

    /** @brief Files in the same folder sharing this file's name without extension. */
    virtual std::vector<std::shared_ptr<PackageFile>> getAssociatedFiles() const = 0;
};

/**
 * @class PackageFolder
 * @brief A folder inside a package.
 */
class PackageFolder {
public:
    virtual ~PackageFolder() = default;

    /** @brief Child folder by name, or nullptr. */
    virtual std::shared_ptr<PackageFolder> resolve(const std::string& name) const = 0;

    /** @brief All files below this folder, recursively. */
    virtual std::vector<std::shared_ptr<PackageFile>> listFiles() const = 0;
};

/**
 * @struct RepositorySignature
 * @brief Repository signing metadata stamped on the package by the publishing feed.
 */
struct RepositorySignature {
    std::string serviceIndexUrl;

    /** @brief Lower-cased host of the service index URL, or empty if it has none. */
    std::string serviceIndexHost() const;
};

/**
 * @class Package
 * @brief A package with identity, provenance and a file tree.
 */
class Package {
public:
    virtual ~Package() = default;

    virtual std::string id() const = 0;
    virtual std::string normalizedVersion() const = 0;
    virtual std::optional<RepositorySignature> repositorySignature() const = 0;
    virtual std::shared_ptr<PackageFolder> rootFolder() const = 0;
};

} // namespace symbolgate::domain
