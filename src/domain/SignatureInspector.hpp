/**
 * @file SignatureInspector.hpp
 * @brief Interface for inspecting Authenticode signatures of a binary.
 */

#pragma once
#include <string>
#include <vector>

namespace symbolgate::domain {

/**
 * @enum SignatureCheckResult
 * @brief Outcome of validating the signatures of a file.
 */
enum class SignatureCheckResult {
    Valid,
    NoSignature,
    BadDigest,
    UntrustedRoot,
    Invalid
};

/**
 * @struct Signature
 * @brief One signature found on a file.
 */
struct Signature {
    std::string signingCertificateSubject; ///< e.g. "CN=Contoso, O=Contoso, L=Seattle, S=Washington, C=US"
    std::string digestAlgorithm;
};

/**
 * @class SignatureInspector
 * @brief Extracts and validates code signatures of files on disk.
 */
class SignatureInspector {
public:
    virtual ~SignatureInspector() = default;

    /** @brief Signatures in file order; the primary signature comes first. */
    virtual std::vector<Signature> getSignatures(const std::string& path) = 0;

    /** @brief Validates the signature chain of the file. */
    virtual SignatureCheckResult validate(const std::string& path) = 0;
};

} // namespace symbolgate::domain
