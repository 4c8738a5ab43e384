/**
 * @file ZipPackage.hpp
 * @brief Package backed by a .nupkg / .snupkg zip archive.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Package.hpp"
#include "domain/SymbolSource.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace symbolgate::infrastructure {

/**
 * @struct ZipPackageIndex
 * @brief Content files of an archive, keyed by package path. Shared by files and folders.
 */
struct ZipPackageIndex {
    struct Item {
        std::string path;  ///< Package path with '\' separators.
        std::size_t entry; ///< Index into archive->entries().
    };

    std::shared_ptr<ZipArchive> archive;
    std::vector<Item> items;
};

/**
 * @class ZipPackage
 * @brief domain::Package implementation reading identity from the .nuspec and provenance from
 * the repository signature.
 */
class ZipPackage : public domain::Package {
public:
    /** @throws std::runtime_error if the data is not a readable zip. */
    static std::shared_ptr<ZipPackage> FromBuffer(domain::Blob data);
    static std::shared_ptr<ZipPackage> Open(const std::string& path);

    std::string id() const override { return m_id; }
    std::string normalizedVersion() const override;
    std::optional<domain::RepositorySignature> repositorySignature() const override { return m_repositorySignature; }
    std::shared_ptr<domain::PackageFolder> rootFolder() const override;

    /** @brief Raw version string from the manifest. */
    const std::string& version() const { return m_version; }

    /** @brief Looks up a content file by package path, ignoring case. */
    std::shared_ptr<domain::PackageFile> findFile(const std::string& path) const;

    /** @brief All content files in archive order. */
    std::vector<std::shared_ptr<domain::PackageFile>> files() const;

    /** @brief Converts a zip entry name to a package path ("lib/a%2Bb.dll" -> "lib\a+b.dll"). */
    static std::string ToPackagePath(const std::string& entryName);

private:
    explicit ZipPackage(std::shared_ptr<ZipArchive> archive);

    void load();
    /** @throws std::runtime_error if the manifest is not well-formed XML. */
    void readManifest(const std::string& xml);

    std::shared_ptr<ZipPackageIndex> m_index;
    std::string m_id;
    std::string m_version;
    std::optional<domain::RepositorySignature> m_repositorySignature;
};

} // namespace symbolgate::infrastructure
