/**
 * @file OsslSigncodeInspector.cpp
 * @brief Implementation of OsslSigncodeInspector.
 */

#include "infrastructure/OsslSigncodeInspector.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace symbolgate::infrastructure {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string RenameComponent(const std::string& component) {
    auto eq = component.find('=');
    if (eq == std::string::npos) return component;
    std::string key = component.substr(0, eq);
    std::string value = component.substr(eq + 1);
    if (key == "ST") key = "S";
    else if (key == "emailAddress") key = "E";
    return key + "=" + value;
}

} // namespace

OsslSigncodeInspector::OsslSigncodeInspector(const std::string& toolPath) : m_toolPath(toolPath) {}

OsslSigncodeInspector::Verification OsslSigncodeInspector::verify(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        auto it = m_lastRun.find(path);
        if (it != m_lastRun.end()) return it->second;
    }

    std::string cmd = ProcessRunner::Quote(m_toolPath) + " verify -in " + ProcessRunner::Quote(path) + " 2>&1";
    auto result = ProcessRunner::Run(cmd);
    if (result.exitCode == -1) {
        std::cerr << "[OsslSigncodeInspector] Could not run " << m_toolPath << std::endl;
    }

    Verification verification{result.exitCode, result.output};
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_lastRun.clear();
    m_lastRun[path] = verification;
    return verification;
}

std::vector<domain::Signature> OsslSigncodeInspector::getSignatures(const std::string& path) {
    return ParseSignatures(verify(path).output);
}

domain::SignatureCheckResult OsslSigncodeInspector::validate(const std::string& path) {
    auto verification = verify(path);
    return ParseVerification(verification.output, verification.exitCode);
}

std::vector<domain::Signature> OsslSigncodeInspector::ParseSignatures(const std::string& output) {
    std::vector<domain::Signature> signatures;
    std::istringstream in(output);
    std::string line;

    bool inSignerSection = false;
    bool haveSigner = false;
    std::string digest;

    while (std::getline(in, line)) {
        std::string text = Trim(line);

        if (text.rfind("Signature Index:", 0) == 0) {
            inSignerSection = false;
            haveSigner = false;
            digest.clear();
            continue;
        }
        if (text.rfind("Message digest algorithm", 0) == 0) {
            auto colon = text.find(':');
            if (colon != std::string::npos) digest = Trim(text.substr(colon + 1));
            continue;
        }
        if (text.rfind("Signer's certificate:", 0) == 0) {
            inSignerSection = true;
            continue;
        }
        if (inSignerSection && !haveSigner && text.rfind("Subject:", 0) == 0) {
            domain::Signature signature;
            signature.signingCertificateSubject = ToDistinguishedName(Trim(text.substr(8)));
            signature.digestAlgorithm = digest;
            signatures.push_back(std::move(signature));
            haveSigner = true;
        }
    }
    return signatures;
}

domain::SignatureCheckResult OsslSigncodeInspector::ParseVerification(const std::string& output, int exitCode) {
    if (Contains(output, "No signature found")) {
        return domain::SignatureCheckResult::NoSignature;
    }
    if (Contains(output, "Signature verification: failed")) {
        if (Contains(output, "MISMATCH")) {
            return domain::SignatureCheckResult::BadDigest;
        }
        if (Contains(output, "unable to get local issuer certificate") ||
            Contains(output, "self-signed certificate") ||
            Contains(output, "self signed certificate")) {
            return domain::SignatureCheckResult::UntrustedRoot;
        }
        return domain::SignatureCheckResult::Invalid;
    }
    if (exitCode == 0 && Contains(output, "Signature verification: ok")) {
        return domain::SignatureCheckResult::Valid;
    }
    return domain::SignatureCheckResult::Invalid;
}

std::string OsslSigncodeInspector::ToDistinguishedName(const std::string& subject) {
    std::vector<std::string> components;

    if (!subject.empty() && subject[0] == '/') {
        std::stringstream ss(subject.substr(1));
        std::string part;
        while (std::getline(ss, part, '/')) {
            if (!part.empty()) components.push_back(RenameComponent(part));
        }
        std::reverse(components.begin(), components.end());
    } else {
        std::string rest = subject;
        size_t pos;
        while ((pos = rest.find(", ")) != std::string::npos) {
            components.push_back(RenameComponent(rest.substr(0, pos)));
            rest = rest.substr(pos + 2);
        }
        if (!rest.empty()) components.push_back(RenameComponent(rest));
    }

    std::string dn;
    for (const auto& component : components) {
        if (!dn.empty()) dn += ", ";
        dn += component;
    }
    return dn;
}

} // namespace symbolgate::infrastructure
