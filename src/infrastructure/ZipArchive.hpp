/**
 * @file ZipArchive.hpp
 * @brief Minimal read-only zip container reader used for .nupkg and .snupkg files.
 */

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace symbolgate::infrastructure {

/**
 * @class ZipArchive
 * @brief Parses the central directory of an in-memory zip and extracts entries.
 *
 * Supports stored and deflate entries. Zip64, encryption and multi-disk archives are rejected.
 * All parse failures throw std::runtime_error.
 */
class ZipArchive {
public:
    struct Entry {
        std::string name;               ///< Raw entry name as stored ('/' separated).
        std::uint16_t method = 0;       ///< 0 = stored, 8 = deflate.
        std::uint16_t flags = 0;
        std::uint32_t crc32 = 0;
        std::uint32_t compressedSize = 0;
        std::uint32_t uncompressedSize = 0;
        std::uint32_t localHeaderOffset = 0;

        bool isDirectory() const { return !name.empty() && name.back() == '/'; }
    };

    static std::shared_ptr<ZipArchive> FromBuffer(std::string data);
    static std::shared_ptr<ZipArchive> Open(const std::string& path);

    const std::vector<Entry>& entries() const { return m_entries; }

    /** @brief Decompresses an entry and verifies its CRC. */
    std::string extract(const Entry& entry) const;

private:
    explicit ZipArchive(std::string data);

    void readCentralDirectory();
    std::uint16_t read16(std::size_t offset) const;
    std::uint32_t read32(std::size_t offset) const;
    void require(std::size_t offset, std::size_t length) const;

    std::string m_data;
    std::vector<Entry> m_entries;
};

} // namespace symbolgate::infrastructure
