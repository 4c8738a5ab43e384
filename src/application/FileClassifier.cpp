/**
 * @file FileClassifier.cpp
 * @brief Implementation of FileClassifier.
 */

#include "application/FileClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace symbolgate::application {

namespace {
const char* const kScannedFolders[] = {"lib", "runtimes"};
}

std::string FileClassifier::LowerExtension(const std::string& path) {
    auto slash = path.find_last_of("\\/");
    auto dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return {};
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext;
}

bool FileClassifier::IsBinaryModule(const std::string& path) {
    std::string ext = LowerExtension(path);
    return ext == ".dll" || ext == ".exe" || ext == ".winmd";
}

bool FileClassifier::IsSatelliteAssembly(const std::string& path) {
    // Matched case-sensitively; "X.Resources.DLL" is an ordinary binary
    static const std::regex pattern(R"(^(.*)\\[^\\]+\\([^\\]+)\.resources\.dll$)");
    return std::regex_match(path, pattern);
}

FileClassifier::Classification FileClassifier::Classify(const domain::PackageFolder& root) {
    Classification result;
    std::unordered_set<std::string> seen;

    for (const char* folderName : kScannedFolders) {
        auto folder = root.resolve(folderName);
        if (!folder) continue;

        for (const auto& file : folder->listFiles()) {
            if (!file || !IsBinaryModule(file->path())) continue;
            if (!seen.insert(file->path()).second) continue;

            if (IsSatelliteAssembly(file->path())) {
                result.satellites.push_back(file);
                continue;
            }

            FileWithPdb candidate;
            candidate.primary = file;
            for (const auto& associated : file->getAssociatedFiles()) {
                if (associated && LowerExtension(associated->path()) == ".pdb") {
                    candidate.pdb = associated;
                    break;
                }
            }
            result.candidates.push_back(std::move(candidate));
        }
    }

    return result;
}

} // namespace symbolgate::application
