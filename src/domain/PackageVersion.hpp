/**
 * @file PackageVersion.hpp
 * @brief Normalization of package version strings.
 */

#pragma once
#include <string>

namespace symbolgate::domain {

/**
 * @brief Normalizes a version to the form used in feed URLs.
 *
 * "01.2" becomes "1.2.0", "1.0.0.0" becomes "1.0.0", "2.1.0-Beta+sha.1" becomes "2.1.0-Beta".
 * Input that does not start with a numeric version is returned trimmed but otherwise unchanged.
 */
std::string NormalizeVersion(const std::string& version);

} // namespace symbolgate::domain
