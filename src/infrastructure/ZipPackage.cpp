/**
 * @file ZipPackage.cpp
 * @brief Implementation of ZipPackage and its file/folder views.
 */

#include "infrastructure/ZipPackage.hpp"
#include "domain/PackageVersion.hpp"
#include "infrastructure/PackageSignatureReader.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <pugixml.hpp>

namespace symbolgate::infrastructure {

namespace {

constexpr const char* kSignatureEntry = ".signature.p7s";

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsPackagingMetadata(const std::string& entryName) {
    std::string lower = ToLower(entryName);
    if (lower == "[content_types].xml" || lower == kSignatureEntry) return true;
    if (lower.rfind("_rels/", 0) == 0 || lower.rfind("package/", 0) == 0) return true;
    // The manifest lives at the root
    return lower.find('/') == std::string::npos && EndsWith(lower, ".nuspec");
}

std::string ParentOf(const std::string& path) {
    auto slash = path.rfind('\\');
    return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

std::string StemOf(const std::string& path) {
    auto slash = path.rfind('\\');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

std::string Trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Child element by local name, so a prefixed nuspec namespace still matches.
pugi::xml_node ChildByLocalName(const pugi::xml_node& parent, const char* localName) {
    for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
        if (child.type() != pugi::node_element) continue;
        std::string name = child.name();
        auto colon = name.find(':');
        if ((colon == std::string::npos ? name : name.substr(colon + 1)) == localName) return child;
    }
    return pugi::xml_node();
}

class ZipPackageFile : public domain::PackageFile {
public:
    ZipPackageFile(std::shared_ptr<const ZipPackageIndex> index, std::size_t item)
        : m_index(std::move(index)), m_item(item) {}

    const std::string& path() const override { return m_index->items[m_item].path; }

    std::unique_ptr<std::istream> openStream() const override {
        const auto& entry = m_index->archive->entries()[m_index->items[m_item].entry];
        return std::make_unique<std::istringstream>(m_index->archive->extract(entry),
                                                    std::ios::in | std::ios::binary);
    }

    std::vector<std::shared_ptr<domain::PackageFile>> getAssociatedFiles() const override {
        std::vector<std::shared_ptr<domain::PackageFile>> associated;
        const std::string parent = ToLower(ParentOf(path()));
        const std::string stem = ToLower(StemOf(path()));
        for (std::size_t i = 0; i < m_index->items.size(); ++i) {
            if (i == m_item) continue;
            const auto& other = m_index->items[i].path;
            if (ToLower(ParentOf(other)) == parent && ToLower(StemOf(other)) == stem) {
                associated.push_back(std::make_shared<ZipPackageFile>(m_index, i));
            }
        }
        return associated;
    }

private:
    std::shared_ptr<const ZipPackageIndex> m_index;
    std::size_t m_item;
};

class ZipPackageFolder : public domain::PackageFolder {
public:
    ZipPackageFolder(std::shared_ptr<const ZipPackageIndex> index, std::string prefix)
        : m_index(std::move(index)), m_prefix(std::move(prefix)) {}

    std::shared_ptr<domain::PackageFolder> resolve(const std::string& name) const override {
        std::string childPrefix = m_prefix + name + "\\";
        std::string lowerPrefix = ToLower(childPrefix);
        for (const auto& item : m_index->items) {
            if (ToLower(item.path).rfind(lowerPrefix, 0) == 0) {
                // Keep the stored casing of the folder name
                return std::make_shared<ZipPackageFolder>(m_index, item.path.substr(0, childPrefix.size()));
            }
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<domain::PackageFile>> listFiles() const override {
        std::vector<std::shared_ptr<domain::PackageFile>> files;
        const std::string lowerPrefix = ToLower(m_prefix);
        for (std::size_t i = 0; i < m_index->items.size(); ++i) {
            if (ToLower(m_index->items[i].path).rfind(lowerPrefix, 0) == 0) {
                files.push_back(std::make_shared<ZipPackageFile>(m_index, i));
            }
        }
        return files;
    }

private:
    std::shared_ptr<const ZipPackageIndex> m_index;
    std::string m_prefix; ///< Empty for the root, otherwise ends with '\'.
};

} // namespace

ZipPackage::ZipPackage(std::shared_ptr<ZipArchive> archive)
    : m_index(std::make_shared<ZipPackageIndex>()) {
    m_index->archive = std::move(archive);
}

std::shared_ptr<ZipPackage> ZipPackage::FromBuffer(domain::Blob data) {
    std::shared_ptr<ZipPackage> package(new ZipPackage(ZipArchive::FromBuffer(std::move(data))));
    package->load();
    return package;
}

std::shared_ptr<ZipPackage> ZipPackage::Open(const std::string& path) {
    std::shared_ptr<ZipPackage> package(new ZipPackage(ZipArchive::Open(path)));
    package->load();
    return package;
}

void ZipPackage::load() {
    const auto& entries = m_index->archive->entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.isDirectory()) continue;

        std::string lower = ToLower(entry.name);
        if (lower.find('/') == std::string::npos && EndsWith(lower, ".nuspec")) {
            try {
                readManifest(m_index->archive->extract(entry));
            } catch (const std::exception& e) {
                std::cerr << "[ZipPackage] Cannot read manifest " << entry.name << ": " << e.what() << std::endl;
            }
            continue;
        }
        if (lower == kSignatureEntry) {
            try {
                auto url = PackageSignatureReader::ReadServiceIndexUrl(m_index->archive->extract(entry));
                if (url) {
                    m_repositorySignature = domain::RepositorySignature{*url};
                }
            } catch (const std::exception& e) {
                std::cerr << "[ZipPackage] Cannot read package signature: " << e.what() << std::endl;
            }
            continue;
        }
        if (IsPackagingMetadata(entry.name)) continue;

        m_index->items.push_back({ToPackagePath(entry.name), i});
    }
}

void ZipPackage::readManifest(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw std::runtime_error(std::string("Malformed nuspec: ") + result.description());
    }

    pugi::xml_node metadata = ChildByLocalName(ChildByLocalName(doc, "package"), "metadata");
    if (!metadata) {
        throw std::runtime_error("nuspec has no package/metadata element");
    }
    m_id = Trim(ChildByLocalName(metadata, "id").text().as_string());
    m_version = Trim(ChildByLocalName(metadata, "version").text().as_string());
}

std::string ZipPackage::normalizedVersion() const {
    return domain::NormalizeVersion(m_version);
}

std::shared_ptr<domain::PackageFolder> ZipPackage::rootFolder() const {
    return std::make_shared<ZipPackageFolder>(m_index, "");
}

std::shared_ptr<domain::PackageFile> ZipPackage::findFile(const std::string& path) const {
    std::string wanted = ToLower(path);
    for (std::size_t i = 0; i < m_index->items.size(); ++i) {
        if (ToLower(m_index->items[i].path) == wanted) {
            return std::make_shared<ZipPackageFile>(m_index, i);
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<domain::PackageFile>> ZipPackage::files() const {
    return rootFolder()->listFiles();
}

std::string ZipPackage::ToPackagePath(const std::string& entryName) {
    std::string out;
    out.reserve(entryName.size());
    for (std::size_t i = 0; i < entryName.size(); ++i) {
        char c = entryName[i];
        if (c == '%' && i + 2 < entryName.size() &&
            std::isxdigit(static_cast<unsigned char>(entryName[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(entryName[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(entryName.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (c == '/') {
            out.push_back('\\');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace symbolgate::infrastructure
