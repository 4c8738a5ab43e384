/**
 * @file ZipArchive.cpp
 * @brief Implementation of ZipArchive.
 */

#include "infrastructure/ZipArchive.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <zlib.h>

namespace symbolgate::infrastructure {

namespace {
constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr std::uint32_t kCentralDirEntrySignature = 0x02014b50;
constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kCentralDirEntrySize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;
}

ZipArchive::ZipArchive(std::string data) : m_data(std::move(data)) {}

std::shared_ptr<ZipArchive> ZipArchive::FromBuffer(std::string data) {
    std::shared_ptr<ZipArchive> archive(new ZipArchive(std::move(data)));
    archive->readCentralDirectory();
    return archive;
}

std::shared_ptr<ZipArchive> ZipArchive::Open(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open archive: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return FromBuffer(buffer.str());
}

void ZipArchive::require(std::size_t offset, std::size_t length) const {
    if (offset > m_data.size() || length > m_data.size() - offset) {
        throw std::runtime_error("Zip archive is truncated");
    }
}

std::uint16_t ZipArchive::read16(std::size_t offset) const {
    require(offset, 2);
    auto b = reinterpret_cast<const unsigned char*>(m_data.data() + offset);
    return static_cast<std::uint16_t>(b[0] | (b[1] << 8));
}

std::uint32_t ZipArchive::read32(std::size_t offset) const {
    require(offset, 4);
    auto b = reinterpret_cast<const unsigned char*>(m_data.data() + offset);
    return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
}

void ZipArchive::readCentralDirectory() {
    if (m_data.size() < kEndOfCentralDirSize) {
        throw std::runtime_error("Not a zip archive");
    }

    // Scan backwards for the end-of-central-directory record; it may be followed by a comment.
    std::size_t eocd = std::string::npos;
    std::size_t lowest = m_data.size() > kEndOfCentralDirSize + kMaxCommentSize
        ? m_data.size() - kEndOfCentralDirSize - kMaxCommentSize
        : 0;
    for (std::size_t pos = m_data.size() - kEndOfCentralDirSize + 1; pos-- > lowest;) {
        if (read32(pos) == kEndOfCentralDirSignature) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        throw std::runtime_error("Zip end of central directory not found");
    }

    std::uint16_t diskNumber = read16(eocd + 4);
    std::uint16_t centralDirDisk = read16(eocd + 6);
    std::uint16_t totalEntries = read16(eocd + 10);
    std::uint32_t centralDirOffset = read32(eocd + 16);

    if (diskNumber != 0 || centralDirDisk != 0) {
        throw std::runtime_error("Multi-disk zip archives are not supported");
    }
    if (totalEntries == 0xFFFF || centralDirOffset == 0xFFFFFFFF) {
        throw std::runtime_error("Zip64 archives are not supported");
    }

    std::size_t pos = centralDirOffset;
    m_entries.reserve(totalEntries);
    for (std::uint16_t i = 0; i < totalEntries; ++i) {
        if (read32(pos) != kCentralDirEntrySignature) {
            throw std::runtime_error("Corrupt zip central directory");
        }
        require(pos, kCentralDirEntrySize);

        Entry entry;
        entry.flags = read16(pos + 8);
        entry.method = read16(pos + 10);
        entry.crc32 = read32(pos + 16);
        entry.compressedSize = read32(pos + 20);
        entry.uncompressedSize = read32(pos + 24);
        std::uint16_t nameLength = read16(pos + 28);
        std::uint16_t extraLength = read16(pos + 30);
        std::uint16_t commentLength = read16(pos + 32);
        entry.localHeaderOffset = read32(pos + 42);

        require(pos + kCentralDirEntrySize, nameLength);
        entry.name = m_data.substr(pos + kCentralDirEntrySize, nameLength);

        m_entries.push_back(std::move(entry));
        pos += kCentralDirEntrySize + nameLength + extraLength + commentLength;
    }
}

std::string ZipArchive::extract(const Entry& entry) const {
    if (entry.flags & kFlagEncrypted) {
        throw std::runtime_error("Encrypted zip entry: " + entry.name);
    }

    std::size_t header = entry.localHeaderOffset;
    if (read32(header) != kLocalHeaderSignature) {
        throw std::runtime_error("Corrupt zip local header: " + entry.name);
    }
    std::uint16_t nameLength = read16(header + 26);
    std::uint16_t extraLength = read16(header + 28);
    std::size_t dataOffset = header + kLocalHeaderSize + nameLength + extraLength;
    require(dataOffset, entry.compressedSize);

    std::string output;
    if (entry.method == kMethodStored) {
        output = m_data.substr(dataOffset, entry.compressedSize);
    } else if (entry.method == kMethodDeflate) {
        // One spare byte so an entry larger than advertised is detected
        output.resize(static_cast<std::size_t>(entry.uncompressedSize) + 1);

        z_stream zs{};
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
            throw std::runtime_error("inflateInit2 failed");
        }
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(m_data.data() + dataOffset));
        zs.avail_in = static_cast<uInt>(entry.compressedSize);
        zs.next_out = reinterpret_cast<Bytef*>(&output[0]);
        zs.avail_out = static_cast<uInt>(output.size());

        int rc = inflate(&zs, Z_FINISH);
        uLong produced = zs.total_out;
        inflateEnd(&zs);

        if (rc != Z_STREAM_END || produced != entry.uncompressedSize) {
            throw std::runtime_error("Failed to inflate zip entry: " + entry.name);
        }
        output.resize(produced);
    } else {
        throw std::runtime_error("Unsupported zip compression method " + std::to_string(entry.method) +
                                 " for " + entry.name);
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(output.data()), static_cast<uInt>(output.size()));
    if (static_cast<std::uint32_t>(crc) != entry.crc32) {
        throw std::runtime_error("CRC mismatch in zip entry: " + entry.name);
    }
    return output;
}

} // namespace symbolgate::infrastructure
