/**
 * @file SymbolValidator.cpp
 * @brief Implementation of SymbolValidator.
 */

#include "application/SymbolValidator.hpp"
#include "application/FileClassifier.hpp"
#include "infrastructure/StreamUtils.hpp"
#include "infrastructure/TemporaryFile.hpp"
#include "infrastructure/ZipPackage.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace symbolgate::application {

using infrastructure::StreamUtils;

namespace {

constexpr const char* kTrustedRegistryDomain = "nuget.org";

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) joined += "\n";
        joined += line;
    }
    return joined;
}

std::string ChangeExtension(const std::string& path, const std::string& extension) {
    auto slash = path.rfind('\\');
    auto dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + extension;
    }
    return path.substr(0, dot) + extension;
}

} // namespace

SymbolValidator::SymbolValidator(std::shared_ptr<domain::Package> package, Dependencies dependencies)
    : m_package(std::move(package))
    , m_deps(std::move(dependencies))
    , m_vendorCheck(m_deps.signatureInspector, m_deps.tempDirectory) {
    if (!m_package) {
        throw std::invalid_argument("SymbolValidator requires a package");
    }
    if (!m_deps.taskManager) {
        m_deps.taskManager = std::make_shared<AsyncTaskManager>();
    }

    // The registry stamps its service index on every package it repository-signs.
    auto signature = m_package->repositorySignature();
    if (signature && IsTrustedRegistryHost(signature->serviceIndexHost())) {
        m_publishedOnTrustedRegistry = true;
    }
}

SymbolValidator::~SymbolValidator() {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_currentToken) m_currentToken->cancel();
    }
    m_deps.taskManager->WaitIdle();
}

bool SymbolValidator::IsTrustedRegistryHost(const std::string& host) {
    std::string lower = host;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });

    const std::string domain = kTrustedRegistryDomain;
    if (lower == domain) return true;
    const std::string suffix = "." + domain;
    return lower.size() > suffix.size() &&
           lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
}

domain::SymbolValidationResult SymbolValidator::getResult() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.result;
}

std::optional<std::string> SymbolValidator::getErrorMessage() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.errorMessage;
}

ValidationSnapshot SymbolValidator::getSnapshot() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

int SymbolValidator::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    int id = m_nextListenerId++;
    m_listeners[id] = std::move(listener);
    return id;
}

void SymbolValidator::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    m_listeners.erase(id);
}

std::shared_ptr<TaskStatus> SymbolValidator::refresh() {
    auto token = std::make_shared<domain::CancellationToken>();
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        generation = beginGeneration(token);
    }
    return startPass(generation, token);
}

void SymbolValidator::onPackageChanged(const std::optional<std::string>& propertyName) {
    if (propertyName) {
        return;
    }

    // Superseding the running pass and resetting to Pending happen together, so the old pass
    // can no longer publish over the reset.
    auto token = std::make_shared<domain::CancellationToken>();
    ValidationSnapshot pending;
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        generation = beginGeneration(token);
        m_state = pending;
    }
    notify(generation, pending);
    startPass(generation, token);
}

std::uint64_t SymbolValidator::beginGeneration(const std::shared_ptr<domain::CancellationToken>& token) {
    if (m_currentToken) m_currentToken->cancel();
    m_currentToken = token;
    return ++m_generation;
}

std::shared_ptr<TaskStatus> SymbolValidator::startPass(std::uint64_t generation,
                                                       std::shared_ptr<domain::CancellationToken> token) {
    return m_deps.taskManager->SubmitTask(
        TaskType::SymbolValidation,
        "Validating symbols for " + m_package->id(),
        [this, generation, token](std::shared_ptr<TaskStatus> status) {
            runPass(generation, *token, status.get());
        });
}

void SymbolValidator::runPass(std::uint64_t generation, const domain::CancellationToken& token, TaskStatus* status) {
    std::optional<ValidationSnapshot> snapshot;
    try {
        std::vector<FileWithPdb> files;
        if (auto root = m_package->rootFolder()) {
            auto classification = FileClassifier::Classify(*root);
            for (const auto& satellite : classification.satellites) {
                std::cout << "[SymbolValidator] Skipping satellite assembly " << satellite->path() << std::endl;
            }
            files = std::move(classification.candidates);
        }

        ValidationContext context = calculateValidity(std::move(files), token, status);
        if (!token.isCancelled()) {
            snapshot = ValidationReport::Aggregate(context);
        }
    } catch (const std::exception& e) {
        if (m_deps.diagnostics) {
            m_deps.diagnostics->trackException(e, "Symbol validation of " + m_package->id());
        } else {
            std::cerr << "[SymbolValidator] Validation failed: " << e.what() << std::endl;
        }
    }

    if (token.isCancelled()) {
        return;
    }
    publish(generation, snapshot);
}

ValidationContext SymbolValidator::calculateValidity(std::vector<FileWithPdb> files,
                                                     const domain::CancellationToken& token,
                                                     TaskStatus* status) {
    ValidationContext context;
    context.filesWithPdb = std::move(files);

    // Local checks first
    std::size_t done = 0;
    for (const auto& file : context.filesWithPdb) {
        if (token.isCancelled()) return context;

        applyOutcome(context, FileWithDebugData{file.primary, std::nullopt}, inspectLocal(file));

        if (status) {
            status->progress = 0.5f * static_cast<float>(++done) / static_cast<float>(context.filesWithPdb.size());
        }
    }

    if (!context.noSymbols.empty() && m_publishedOnTrustedRegistry) {
        recoverFromRegistry(context, token);
    }
    if (status) status->progress = 0.75f;

    if (!context.noSymbols.empty()) {
        recoverFromPlatformServer(context, token);
    }

    return context;
}

DebugOutcome SymbolValidator::inspectLocal(const FileWithPdb& file) const {
    try {
        if (file.pdb) {
            FileWithDebugData input{file.primary, std::nullopt};
            return validatePdb(input, file.pdb->openStream());
        }
        return inspectEmbedded(*file.primary);
    } catch (const std::exception& e) {
        std::cerr << "[SymbolValidator] Cannot read debug data of " << file.primary->path() << ": " << e.what() << std::endl;
        return Unavailable{std::nullopt};
    }
}

DebugOutcome SymbolValidator::inspectEmbedded(const domain::PackageFile& file) const {
    if (!m_deps.debugReader) {
        return Unavailable{std::nullopt};
    }

    auto stream = file.openStream();
    infrastructure::TemporaryFile tempFile(*stream, FileClassifier::LowerExtension(file.path()), m_deps.tempDirectory);

    std::optional<domain::AssemblyMetadata> metadata;
    try {
        metadata = m_deps.debugReader->readFromFile(tempFile.fileName());
    } catch (const domain::DebugDataFormatError& e) {
        return Degraded{e.what()};
    }

    if (metadata && metadata->debugData.hasDebugInfo) {
        return Inspected{metadata->debugData};
    }

    // No embedded pdb; keep whatever keys we have for the symbol server
    if (metadata) {
        return Unavailable{metadata->debugData};
    }
    return Unavailable{std::nullopt};
}

DebugOutcome SymbolValidator::validatePdb(FileWithDebugData& input, std::unique_ptr<std::istream> pdbStream) const {
    if (!m_deps.debugReader) {
        throw std::runtime_error("No debug data reader configured");
    }

    auto peStream = StreamUtils::MakeSeekable(input.file->openStream());

    try {
        // Re-read when all we have is a shell carrying symbol keys
        if (!input.debugData || !input.debugData->hasDebugInfo) {
            auto seekablePdb = StreamUtils::MakeSeekable(std::move(pdbStream));
            input.debugData = m_deps.debugReader->readDebugData(*peStream, *seekablePdb);
        }
        return Inspected{*input.debugData};
    } catch (const domain::DebugDataFormatError& e) {
        return Degraded{e.what()};
    }
}

void SymbolValidator::applyOutcome(ValidationContext& context, const FileWithDebugData& file, const DebugOutcome& outcome) const {
    if (const auto* inspected = std::get_if<Inspected>(&outcome)) {
        if (!inspected->debugData.hasSourceLink) {
            context.noSourceLink.push_back(file.file);
        }
        if (!inspected->debugData.sourceLinkErrors.empty()) {
            context.sourceLinkErrors.push_back({file.file, JoinLines(inspected->debugData.sourceLinkErrors)});
        }
    } else if (const auto* degraded = std::get_if<Degraded>(&outcome)) {
        std::cout << "[SymbolValidator] Unreadable debug data for " << file.file->path() << ": " << degraded->reason << std::endl;
        context.noSourceLink.push_back(file.file);
    } else if (const auto* unavailable = std::get_if<Unavailable>(&outcome)) {
        context.noSymbols.push_back({file.file, unavailable->partial ? unavailable->partial : file.debugData});
    }
}

void SymbolValidator::recoverFromRegistry(ValidationContext& context, const domain::CancellationToken& token) const {
    if (!m_deps.registrySource || token.isCancelled()) return;

    domain::SymbolKey key{m_package->id() + "/" + m_package->normalizedVersion(), {}};
    auto blob = m_deps.registrySource->fetch(key, token);
    if (!blob) {
        return;
    }
    context.requireExternal = true;

    std::shared_ptr<infrastructure::ZipPackage> symbolPackage;
    try {
        symbolPackage = infrastructure::ZipPackage::FromBuffer(std::move(*blob));
    } catch (const std::exception& e) {
        std::cerr << "[SymbolValidator] Symbol package for " << key.key << " is unreadable: " << e.what() << std::endl;
        return;
    }

    std::vector<FileWithDebugData> stillMissing;
    std::vector<std::pair<FileWithDebugData, DebugOutcome>> recovered;

    for (auto& missing : context.noSymbols) {
        auto pdbFile = symbolPackage->findFile(ChangeExtension(missing.file->path(), ".pdb"));
        if (!pdbFile || token.isCancelled()) {
            stillMissing.push_back(missing);
            continue;
        }

        FileWithDebugData candidate = missing;
        try {
            auto outcome = validatePdb(candidate, pdbFile->openStream());
            std::cout << "[SymbolValidator] Found " << pdbFile->path() << " in symbol package" << std::endl;
            recovered.emplace_back(std::move(candidate), std::move(outcome));
        } catch (const std::exception& e) {
            std::cerr << "[SymbolValidator] Cannot validate " << pdbFile->path() << " from symbol package: " << e.what() << std::endl;
            stillMissing.push_back(missing);
        }
    }

    context.noSymbols = std::move(stillMissing);
    for (const auto& [file, outcome] : recovered) {
        applyOutcome(context, file, outcome);
    }
}

void SymbolValidator::recoverFromPlatformServer(ValidationContext& context, const domain::CancellationToken& token) const {
    if (!m_deps.platformSource) return;

    std::vector<FileWithDebugData> stillMissing;
    std::vector<std::pair<FileWithDebugData, DebugOutcome>> recovered;

    for (auto& missing : context.noSymbols) {
        bool eligible = !token.isCancelled() && missing.debugData && !missing.debugData->symbolKeys.empty() &&
                        m_vendorCheck.isVendorFile(*missing.file);
        if (!eligible) {
            stillMissing.push_back(missing);
            continue;
        }

        bool found = false;
        for (const auto& symbolKey : missing.debugData->symbolKeys) {
            if (token.isCancelled()) break;

            auto blob = m_deps.platformSource->fetch(symbolKey, token);
            if (!blob) continue;

            context.requireExternal = true;
            FileWithDebugData candidate = missing;
            try {
                auto outcome = validatePdb(candidate, std::make_unique<std::istringstream>(std::move(*blob), std::ios::in | std::ios::binary));
                recovered.emplace_back(std::move(candidate), std::move(outcome));
                found = true;
            } catch (const std::exception& e) {
                std::cerr << "[SymbolValidator] Cannot validate symbols of " << missing.file->path() << ": " << e.what() << std::endl;
            }
            break;
        }

        if (!found) {
            stillMissing.push_back(missing);
        }
    }

    context.noSymbols = std::move(stillMissing);
    for (const auto& [file, outcome] : recovered) {
        applyOutcome(context, file, outcome);
    }
}

void SymbolValidator::publish(std::uint64_t generation, const std::optional<ValidationSnapshot>& snapshot) {
    ValidationSnapshot settled;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (generation != m_generation) {
            // A newer pass owns the published state
            return;
        }
        if (snapshot) {
            m_state = *snapshot;
        }
        settled = m_state;
    }

    std::cout << "[SymbolValidator] " << m_package->id() << ": " << domain::ToString(settled.result) << std::endl;
    notify(generation, settled);
}

void SymbolValidator::notify(std::uint64_t generation, const ValidationSnapshot& snapshot) {
    std::lock_guard<std::recursive_mutex> ordering(m_notifyMutex);
    {
        // Superseded between settling and notifying
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (generation != m_generation) return;
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& [id, listener] : m_listeners) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(snapshot);
        } catch (const std::exception& e) {
            if (m_deps.diagnostics) {
                m_deps.diagnostics->trackException(e, "Validation listener");
            } else {
                std::cerr << "[SymbolValidator] Listener failed: " << e.what() << std::endl;
            }
        }
    }
}

} // namespace symbolgate::application
