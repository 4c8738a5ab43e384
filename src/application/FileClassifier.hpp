/**
 * @file FileClassifier.hpp
 * @brief Selects the binaries of a package that should carry symbols.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/ValidationContext.hpp"
#include "domain/Package.hpp"

namespace symbolgate::application {

/**
 * @class FileClassifier
 * @brief Partitions the lib/ and runtimes/ binaries into candidates and satellite assemblies.
 */
class FileClassifier {
public:
    struct Classification {
        std::vector<FileWithPdb> candidates;
        std::vector<std::shared_ptr<domain::PackageFile>> satellites;
    };

    /**
     * @brief Classifies the binaries under the "lib" and "runtimes" folders of a package root.
     * @param root Root folder of the package. Missing subfolders are treated as empty.
     */
    static Classification Classify(const domain::PackageFolder& root);

    /** @brief .dll, .exe or .winmd, ignoring case. */
    static bool IsBinaryModule(const std::string& path);

    /** @brief Matches "<dir>\<culture>\<name>.resources.dll". */
    static bool IsSatelliteAssembly(const std::string& path);

    /** @brief Extension including the dot, lower-cased. Empty when there is none. */
    static std::string LowerExtension(const std::string& path);
};

} // namespace symbolgate::application
