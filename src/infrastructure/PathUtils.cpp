#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace symbolgate::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetTempDirectory(const std::string& preferred) {
    if (!preferred.empty()) {
        std::error_code ec;
        fs::path base(preferred);
        if (!fs::exists(base, ec)) {
            fs::create_directories(base, ec);
        }
        if (!ec && fs::is_directory(base, ec)) {
            return base;
        }
        std::cerr << "[PathUtils] Temp directory " << preferred << " unusable, using system default" << std::endl;
    }
    return fs::temp_directory_path();
}

} // namespace symbolgate::infrastructure
