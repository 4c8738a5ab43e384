/**
 * @file OsslSigncodeInspector.hpp
 * @brief SignatureInspector backed by the osslsigncode command line tool.
 */

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "domain/SignatureInspector.hpp"

namespace symbolgate::infrastructure {

class OsslSigncodeInspector : public domain::SignatureInspector {
public:
    explicit OsslSigncodeInspector(const std::string& toolPath = "osslsigncode");

    std::vector<domain::Signature> getSignatures(const std::string& path) override;
    domain::SignatureCheckResult validate(const std::string& path) override;

    /** @brief Extracts the signer certificate of every signature in `osslsigncode verify` output. */
    static std::vector<domain::Signature> ParseSignatures(const std::string& output);

    /** @brief Maps `osslsigncode verify` output to a check result. */
    static domain::SignatureCheckResult ParseVerification(const std::string& output, int exitCode);

    /**
     * @brief Converts an OpenSSL one-line subject ("/C=US/ST=WA/O=X/CN=Y") into
     * "CN=Y, O=X, S=WA, C=US". Subjects already in comma form only get ST renamed to S.
     */
    static std::string ToDistinguishedName(const std::string& subject);

private:
    struct Verification {
        int exitCode = -1;
        std::string output;
    };

    /** @brief Runs the tool once per path; the two interface calls share the result. */
    Verification verify(const std::string& path);

    std::string m_toolPath;
    std::mutex m_cacheMutex;
    std::map<std::string, Verification> m_lastRun; ///< At most one entry.
};

} // namespace symbolgate::infrastructure
