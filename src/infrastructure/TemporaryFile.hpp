/**
 * @file TemporaryFile.hpp
 * @brief Scoped copy of a stream on disk, removed on destruction.
 */

#pragma once
#include <istream>
#include <string>

namespace symbolgate::infrastructure {

/**
 * @class TemporaryFile
 * @brief Materializes a stream into a uniquely named file for tools that need a path.
 */
class TemporaryFile {
public:
    /**
     * @param content Stream to copy, read to its end.
     * @param extension Extension of the file, including the dot.
     * @param directory Target directory; the system temp directory when empty.
     * @throws std::runtime_error if the file cannot be written.
     */
    explicit TemporaryFile(std::istream& content,
                           const std::string& extension = ".tmp",
                           const std::string& directory = "");
    ~TemporaryFile();

    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

    const std::string& fileName() const { return m_fileName; }

private:
    std::string m_fileName;
};

} // namespace symbolgate::infrastructure
