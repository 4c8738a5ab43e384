/**
 * @file TemporaryFile.cpp
 * @brief Implementation of TemporaryFile.
 */

#include "infrastructure/TemporaryFile.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace symbolgate::infrastructure {

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long> g_counter{0};

fs::path MakeUniquePath(const std::string& extension, const std::string& directory) {
    fs::path base = directory.empty() ? fs::temp_directory_path() : fs::path(directory);
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "symbolgate_" + std::to_string(now) + "_" + std::to_string(g_counter++) + extension;
    return base / name;
}
}

TemporaryFile::TemporaryFile(std::istream& content, const std::string& extension, const std::string& directory) {
    fs::path target = MakeUniquePath(extension, directory);
    m_fileName = target.string();

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create temporary file: " + m_fileName);
    }

    char buffer[64 * 1024];
    while (content.read(buffer, sizeof(buffer)) || content.gcount() > 0) {
        out.write(buffer, content.gcount());
        if (!out) break;
    }
    out.flush();

    if (!out || content.bad()) {
        out.close();
        std::error_code ec;
        fs::remove(target, ec);
        throw std::runtime_error("Failed to write temporary file: " + m_fileName);
    }
}

TemporaryFile::~TemporaryFile() {
    std::error_code ec;
    fs::remove(m_fileName, ec);
    if (ec) {
        std::cerr << "[TemporaryFile] Could not remove " << m_fileName << ": " << ec.message() << std::endl;
    }
}

} // namespace symbolgate::infrastructure
