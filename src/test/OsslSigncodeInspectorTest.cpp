#include <cassert>
#include <iostream>

#include "application/VendorSignatureCheck.hpp"
#include "infrastructure/OsslSigncodeInspector.hpp"

using symbolgate::application::VendorSignatureCheck;
using symbolgate::domain::SignatureCheckResult;
using symbolgate::infrastructure::OsslSigncodeInspector;

namespace {

const char* kVendorOutput =
    "Current PE checksum   : 0001A2B3\n"
    "Calculated PE checksum: 0001A2B3\n"
    "\n"
    "Signature Index: 0  (Primary Signature)\n"
    "Message digest algorithm  : SHA256\n"
    "Current message digest    : 8F5D\n"
    "Calculated message digest : 8F5D\n"
    "\n"
    "Signer's certificate:\n"
    "\tSigner #0:\n"
    "\t\tSubject: /C=US/ST=Washington/L=Redmond/O=Microsoft Corporation/CN=Microsoft Corporation\n"
    "\t\tIssuer : /C=US/ST=Washington/L=Redmond/O=Microsoft Corporation/CN=Microsoft Code Signing PCA 2011\n"
    "\t\tSerial : 3300000187\n"
    "\tSigner #1:\n"
    "\t\tSubject: /C=US/ST=Washington/L=Redmond/O=Microsoft Corporation/CN=Microsoft Code Signing PCA 2011\n"
    "\n"
    "Signature Index: 1  (Unauthenticated Attribute)\n"
    "Message digest algorithm  : SHA1\n"
    "\n"
    "Signer's certificate:\n"
    "\tSigner #0:\n"
    "\t\tSubject: /C=US/O=Contoso/CN=Contoso Legacy Signing\n"
    "\n"
    "Signature verification: ok\n"
    "\n"
    "Number of verified signatures: 2\n"
    "Succeeded\n";

}

static void testParseSignatures() {
    std::cout << "[Test] Parsing signer certificates..." << std::endl;
    auto signatures = OsslSigncodeInspector::ParseSignatures(kVendorOutput);
    assert(signatures.size() == 2);
    assert(signatures[0].signingCertificateSubject ==
           "CN=Microsoft Corporation, O=Microsoft Corporation, L=Redmond, S=Washington, C=US");
    assert(signatures[0].digestAlgorithm == "SHA256");
    assert(signatures[1].signingCertificateSubject == "CN=Contoso Legacy Signing, O=Contoso, C=US");
    assert(signatures[1].digestAlgorithm == "SHA1");

    assert(OsslSigncodeInspector::ParseSignatures("No signature found\nFailed\n").empty());
    std::cout << "[PASS] Primary and nested signatures." << std::endl;
}

static void testDistinguishedNames() {
    std::cout << "[Test] Subject conversion..." << std::endl;
    assert(OsslSigncodeInspector::ToDistinguishedName("/C=US/ST=Washington/CN=Fabrikam/emailAddress=ops@fabrikam.com") ==
           "E=ops@fabrikam.com, CN=Fabrikam, S=Washington, C=US");
    assert(OsslSigncodeInspector::ToDistinguishedName("CN=Fabrikam, ST=Oregon, C=US") == "CN=Fabrikam, S=Oregon, C=US");
    assert(OsslSigncodeInspector::ToDistinguishedName("").empty());
    std::cout << "[PASS] Distinguished names." << std::endl;
}

static void testVerification() {
    std::cout << "[Test] Verification results..." << std::endl;
    assert(OsslSigncodeInspector::ParseVerification(kVendorOutput, 0) == SignatureCheckResult::Valid);
    assert(OsslSigncodeInspector::ParseVerification(kVendorOutput, 1) == SignatureCheckResult::Invalid);
    assert(OsslSigncodeInspector::ParseVerification("No signature found\nFailed\n", 1) == SignatureCheckResult::NoSignature);
    assert(OsslSigncodeInspector::ParseVerification(
               "Current message digest    : AAAA\nCalculated message digest : BBBB    MISMATCH!!!\n"
               "Signature verification: failed\n", 1) == SignatureCheckResult::BadDigest);
    assert(OsslSigncodeInspector::ParseVerification(
               "Error: unable to get local issuer certificate\nSignature verification: failed\n", 1) ==
           SignatureCheckResult::UntrustedRoot);
    assert(OsslSigncodeInspector::ParseVerification("Signature verification: failed\n", 1) == SignatureCheckResult::Invalid);
    assert(OsslSigncodeInspector::ParseVerification("", -1) == SignatureCheckResult::Invalid);
    std::cout << "[PASS] Verification mapping." << std::endl;
}

static void testVendorSubject() {
    std::cout << "[Test] Vendor subject suffix..." << std::endl;
    auto signatures = OsslSigncodeInspector::ParseSignatures(kVendorOutput);
    assert(VendorSignatureCheck::IsVendorSubject(signatures[0].signingCertificateSubject));
    assert(!VendorSignatureCheck::IsVendorSubject(signatures[1].signingCertificateSubject));
    assert(VendorSignatureCheck::IsVendorSubject(
        "CN=.NET, O=microsoft corporation, L=REDMOND, S=Washington, C=us"));
    assert(!VendorSignatureCheck::IsVendorSubject("CN=Microsoft Corporation, O=Microsoft Corporation, L=Redmond"));
    std::cout << "[PASS] Vendor subjects." << std::endl;
}

static void testMissingTool() {
    std::cout << "[Test] Signature tool not installed..." << std::endl;
    OsslSigncodeInspector inspector("symbolgate-no-such-signing-tool");
    assert(inspector.getSignatures("/nonexistent/file.dll").empty());
    assert(inspector.validate("/nonexistent/file.dll") != SignatureCheckResult::Valid);
    std::cout << "[PASS] Missing tool never yields a valid signature." << std::endl;
}

int main() {
    std::cout << "[Test] Starting OsslSigncodeInspector Test..." << std::endl;
    testParseSignatures();
    testDistinguishedNames();
    testVerification();
    testVendorSubject();
    testMissingTool();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
