/**
 * @file HttpSymbolSource.hpp
 * @brief HTTPS client for symbol package and symbol server downloads.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "domain/SymbolSource.hpp"

namespace symbolgate::infrastructure {

/**
 * @class HttpSymbolSource
 * @brief Fetches "<base path><key>" from a fixed host. Redirects are followed.
 */
class HttpSymbolSource : public domain::SymbolSource {
public:
    HttpSymbolSource(std::string name, std::string schemeHostPort, std::string basePath, int timeoutSeconds = 60);

    /** @brief nuget.org symbol packages, keyed by "<id>/<normalized version>". */
    static std::shared_ptr<HttpSymbolSource> CreateRegistrySymbolPackageSource(int timeoutSeconds = 60);

    /** @brief Microsoft public symbol server, keyed by symbol key. */
    static std::shared_ptr<HttpSymbolSource> CreatePlatformSymbolServerSource(int timeoutSeconds = 60);

    std::optional<domain::Blob> fetch(const domain::SymbolKey& key, const domain::CancellationToken& token) override;

    std::string name() const override { return m_name; }

    /** @brief Value of the SymbolChecksum header, or empty when there are no checksums. */
    static std::string FormatChecksumHeader(const std::vector<std::string>& checksums);

private:
    std::string m_name;
    std::string m_schemeHostPort;
    std::string m_basePath;
    int m_timeoutSeconds;
};

} // namespace symbolgate::infrastructure
