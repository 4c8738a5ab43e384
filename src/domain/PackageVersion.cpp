#include "domain/PackageVersion.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace symbolgate::domain {

namespace {

std::string Trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool IsNumeric(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

std::string StripLeadingZeros(const std::string& s) {
    size_t i = 0;
    while (i + 1 < s.size() && s[i] == '0') ++i;
    return s.substr(i);
}

} // namespace

std::string NormalizeVersion(const std::string& version) {
    std::string trimmed = Trim(version);

    std::string core = trimmed.substr(0, trimmed.find('+'));
    std::string release;
    auto dash = core.find('-');
    if (dash != std::string::npos) {
        release = core.substr(dash + 1);
        core = core.substr(0, dash);
    }

    std::vector<std::string> parts;
    std::stringstream ss(core);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!IsNumeric(part)) {
            return trimmed;
        }
        parts.push_back(StripLeadingZeros(part));
    }
    if (parts.empty() || parts.size() > 4) {
        return trimmed;
    }

    while (parts.size() < 3) {
        parts.push_back("0");
    }
    if (parts.size() == 4 && parts[3] == "0") {
        parts.pop_back();
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ".";
        out += parts[i];
    }
    if (!release.empty()) {
        out += "-" + release;
    }
    return out;
}

} // namespace symbolgate::domain
