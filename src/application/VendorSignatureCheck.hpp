/**
 * @file VendorSignatureCheck.hpp
 * @brief Decides whether a binary is signed by the platform vendor.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/Package.hpp"
#include "domain/SignatureInspector.hpp"

namespace symbolgate::application {

class VendorSignatureCheck {
public:
    /** @brief Subject suffix identifying the vendor's signing certificates. */
    static constexpr const char* kVendorSubjectSuffix = ", O=Microsoft Corporation, L=Redmond, S=Washington, C=US";

    VendorSignatureCheck(std::shared_ptr<domain::SignatureInspector> inspector, std::string tempDirectory);

    /**
     * @brief Copies the file to disk and inspects its primary signature.
     * @return True only for a valid signature whose signer subject ends with the vendor suffix.
     * Any failure while inspecting returns false.
     */
    bool isVendorFile(const domain::PackageFile& file) const;

    /** @brief Case-insensitive suffix match of a certificate subject. */
    static bool IsVendorSubject(const std::string& subject);

private:
    std::shared_ptr<domain::SignatureInspector> m_inspector;
    std::string m_tempDirectory;
};

} // namespace symbolgate::application
