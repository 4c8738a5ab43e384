/**
 * @file PackageSignatureReader.hpp
 * @brief Reads provenance from a package's .signature.p7s (PKCS#7 SignedData).
 */

#pragma once
#include <optional>
#include <string>

namespace symbolgate::infrastructure {

/**
 * @class PackageSignatureReader
 * @brief Locates the repository signature and returns its nuget-v3-service-index-url.
 *
 * The repository signature is either the primary signer, when its commitment type is
 * proofOfReceipt, or a repository countersignature on an author primary signature.
 * A URL attribute on any other signer is ignored.
 */
class PackageSignatureReader {
public:
    static constexpr const char* kServiceIndexUrlOid = "1.3.6.1.4.1.311.84.2.1.1.1";
    static constexpr const char* kCommitmentTypeOid = "1.2.840.113549.1.9.16.2.16";
    static constexpr const char* kProofOfOriginOid = "1.2.840.113549.1.9.16.6.1";
    static constexpr const char* kProofOfReceiptOid = "1.2.840.113549.1.9.16.6.2";

    /**
     * @brief Service index URL of the repository signature, if the package has one.
     * @throws std::runtime_error if the data is not a PKCS#7 SignedData structure.
     */
    static std::optional<std::string> ReadServiceIndexUrl(const std::string& der);
};

} // namespace symbolgate::infrastructure
