/**
 * @file SymbolValidator.hpp
 * @brief Validates that a package's binaries ship usable symbols with Source Link.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/AsyncTaskManager.hpp"
#include "application/ValidationContext.hpp"
#include "application/ValidationReport.hpp"
#include "application/VendorSignatureCheck.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/DebugDataReader.hpp"
#include "domain/DiagnosticsSink.hpp"
#include "domain/Package.hpp"
#include "domain/SignatureInspector.hpp"
#include "domain/SymbolSource.hpp"

namespace symbolgate::application {

/**
 * @class SymbolValidator
 * @brief Runs validation passes over a package and publishes the verdict.
 *
 * A pass classifies the binaries, checks local and embedded debug data, then tries to recover
 * missing symbols from the registry's symbol package and, for vendor-signed binaries, from the
 * platform symbol server. Observers subscribe to receive each settled snapshot.
 */
class SymbolValidator {
public:
    using Listener = std::function<void(const ValidationSnapshot&)>;

    struct Dependencies {
        std::shared_ptr<domain::DebugDataReader> debugReader;
        std::shared_ptr<domain::SignatureInspector> signatureInspector;
        std::shared_ptr<domain::SymbolSource> registrySource;  ///< Keyed by "<id>/<normalized version>".
        std::shared_ptr<domain::SymbolSource> platformSource;  ///< Keyed by symbol key.
        std::shared_ptr<domain::DiagnosticsSink> diagnostics;
        std::shared_ptr<AsyncTaskManager> taskManager;         ///< A private manager is created when null.
        std::string tempDirectory;                             ///< Empty for the system temp directory.
    };

    SymbolValidator(std::shared_ptr<domain::Package> package, Dependencies dependencies);
    ~SymbolValidator();

    SymbolValidator(const SymbolValidator&) = delete;
    SymbolValidator& operator=(const SymbolValidator&) = delete;

    domain::SymbolValidationResult getResult() const;
    std::optional<std::string> getErrorMessage() const;
    ValidationSnapshot getSnapshot() const;

    /**
     * @brief Registers a listener called after Result/ErrorMessage settle.
     * @return Id for unsubscribe().
     */
    int subscribe(Listener listener);
    void unsubscribe(int id);

    /**
     * @brief Starts a validation pass in the background. A pass started earlier is cancelled and
     * will not publish.
     */
    std::shared_ptr<TaskStatus> refresh();

    /**
     * @brief Reacts to a change of the package context. An unqualified change (no property name)
     * resets the state to Pending and starts a new pass.
     */
    void onPackageChanged(const std::optional<std::string>& propertyName);

    /** @brief Whether the package carries the trusted registry's repository signature. */
    bool isPublishedOnTrustedRegistry() const { return m_publishedOnTrustedRegistry; }

    /** @brief "nuget.org" or any of its subdomains, ignoring case. */
    static bool IsTrustedRegistryHost(const std::string& host);

private:
    /** @brief Cancels the running pass and installs token. Requires m_stateMutex. */
    std::uint64_t beginGeneration(const std::shared_ptr<domain::CancellationToken>& token);
    std::shared_ptr<TaskStatus> startPass(std::uint64_t generation, std::shared_ptr<domain::CancellationToken> token);
    void runPass(std::uint64_t generation, const domain::CancellationToken& token, TaskStatus* status);
    ValidationContext calculateValidity(std::vector<FileWithPdb> files, const domain::CancellationToken& token, TaskStatus* status);

    DebugOutcome inspectLocal(const FileWithPdb& file) const;
    DebugOutcome inspectEmbedded(const domain::PackageFile& file) const;
    DebugOutcome validatePdb(FileWithDebugData& input, std::unique_ptr<std::istream> pdbStream) const;
    void applyOutcome(ValidationContext& context, const FileWithDebugData& file, const DebugOutcome& outcome) const;

    void recoverFromRegistry(ValidationContext& context, const domain::CancellationToken& token) const;
    void recoverFromPlatformServer(ValidationContext& context, const domain::CancellationToken& token) const;

    void publish(std::uint64_t generation, const std::optional<ValidationSnapshot>& snapshot);
    void notify(std::uint64_t generation, const ValidationSnapshot& snapshot);

    std::shared_ptr<domain::Package> m_package;
    Dependencies m_deps;
    VendorSignatureCheck m_vendorCheck;
    bool m_publishedOnTrustedRegistry = false;

    mutable std::mutex m_stateMutex;
    ValidationSnapshot m_state;
    std::uint64_t m_generation = 0;
    std::shared_ptr<domain::CancellationToken> m_currentToken;

    /// Serializes notifications; recursive so a listener may reset the validator.
    std::recursive_mutex m_notifyMutex;

    std::mutex m_listenersMutex;
    std::map<int, Listener> m_listeners;
    int m_nextListenerId = 0;
};

} // namespace symbolgate::application
