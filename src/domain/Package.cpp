#include "domain/Package.hpp"

#include <algorithm>
#include <cctype>

namespace symbolgate::domain {

std::string RepositorySignature::serviceIndexHost() const {
    std::string rest = serviceIndexUrl;
    auto scheme = rest.find("://");
    if (scheme == std::string::npos) {
        return {};
    }
    rest = rest.substr(scheme + 3);

    auto end = rest.find_first_of("/?#");
    std::string host = rest.substr(0, end);

    // Strip userinfo and port
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    auto colon = host.find(':');
    if (colon != std::string::npos) host = host.substr(0, colon);

    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c){ return std::tolower(c); });
    return host;
}

} // namespace symbolgate::domain
