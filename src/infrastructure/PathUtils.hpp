// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace symbolgate::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief The preferred directory if usable, else the system temp directory. */
    static std::filesystem::path GetTempDirectory(const std::string& preferred);
};

} // namespace symbolgate::infrastructure
