#include "infrastructure/HttpSymbolSource.hpp"
#include <httplib.h>
#include <iostream>

namespace symbolgate::infrastructure {

namespace {
constexpr const char* kRegistryHost = "https://www.nuget.org";
constexpr const char* kRegistrySymbolPackagePath = "/api/v2/symbolpackage/";
constexpr const char* kPlatformSymbolHost = "https://msdl.microsoft.com";
constexpr const char* kPlatformSymbolPath = "/download/symbols/";
constexpr const char* kChecksumHeader = "SymbolChecksum";
}

HttpSymbolSource::HttpSymbolSource(std::string name, std::string schemeHostPort, std::string basePath, int timeoutSeconds)
    : m_name(std::move(name))
    , m_schemeHostPort(std::move(schemeHostPort))
    , m_basePath(std::move(basePath))
    , m_timeoutSeconds(timeoutSeconds)
{}

std::shared_ptr<HttpSymbolSource> HttpSymbolSource::CreateRegistrySymbolPackageSource(int timeoutSeconds) {
    return std::make_shared<HttpSymbolSource>("nuget.org symbol packages", kRegistryHost, kRegistrySymbolPackagePath, timeoutSeconds);
}

std::shared_ptr<HttpSymbolSource> HttpSymbolSource::CreatePlatformSymbolServerSource(int timeoutSeconds) {
    return std::make_shared<HttpSymbolSource>("Microsoft symbol server", kPlatformSymbolHost, kPlatformSymbolPath, timeoutSeconds);
}

std::string HttpSymbolSource::FormatChecksumHeader(const std::vector<std::string>& checksums) {
    std::string value;
    for (const auto& checksum : checksums) {
        if (!value.empty()) value += ";";
        value += checksum;
    }
    return value;
}

std::optional<domain::Blob> HttpSymbolSource::fetch(const domain::SymbolKey& key, const domain::CancellationToken& token) {
    if (token.isCancelled()) {
        return std::nullopt;
    }

    httplib::Client cli(m_schemeHostPort);
    cli.set_follow_location(true);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers headers;
    std::string checksums = FormatChecksumHeader(key.checksums);
    if (!checksums.empty()) {
        headers.emplace(kChecksumHeader, checksums);
    }

    const std::string path = m_basePath + key.key;
    auto res = cli.Get(path, headers, [&token](uint64_t, uint64_t) {
        return !token.isCancelled();
    });

    if (!res) {
        std::cerr << "[HttpSymbolSource] " << m_name << ": request for " << path
                  << " failed (error " << static_cast<int>(res.error()) << ")" << std::endl;
        return std::nullopt;
    }
    if (res->status < 200 || res->status >= 300) {
        std::cout << "[HttpSymbolSource] " << m_name << ": HTTP " << res->status << " for " << path << std::endl;
        return std::nullopt;
    }

    std::cout << "[HttpSymbolSource] " << m_name << ": fetched " << path << " (" << res->body.size() << " bytes)" << std::endl;
    return res->body;
}

} // namespace symbolgate::infrastructure
