#include "application/VendorSignatureCheck.hpp"
#include "application/FileClassifier.hpp"
#include "infrastructure/TemporaryFile.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>

namespace symbolgate::application {

VendorSignatureCheck::VendorSignatureCheck(std::shared_ptr<domain::SignatureInspector> inspector, std::string tempDirectory)
    : m_inspector(std::move(inspector)), m_tempDirectory(std::move(tempDirectory)) {}

bool VendorSignatureCheck::IsVendorSubject(const std::string& subject) {
    const std::size_t suffixLength = std::strlen(kVendorSubjectSuffix);
    if (subject.size() < suffixLength) return false;
    return std::equal(subject.end() - suffixLength, subject.end(), kVendorSubjectSuffix,
                      [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

bool VendorSignatureCheck::isVendorFile(const domain::PackageFile& file) const {
    if (!m_inspector) return false;

    try {
        auto stream = file.openStream();
        infrastructure::TemporaryFile tempFile(*stream, FileClassifier::LowerExtension(file.path()), m_tempDirectory);

        auto signatures = m_inspector->getSignatures(tempFile.fileName());
        auto check = m_inspector->validate(tempFile.fileName());

        if (check == domain::SignatureCheckResult::Valid && !signatures.empty()) {
            return IsVendorSubject(signatures.front().signingCertificateSubject);
        }
    } catch (const std::exception& e) {
        std::cerr << "[VendorSignatureCheck] Cannot inspect " << file.path() << ": " << e.what() << std::endl;
    }
    return false;
}

} // namespace symbolgate::application
