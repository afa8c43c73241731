/**
 * @file SourceReconciler.hpp
 * @brief Common reconciliation flow of every source kind.
 */

#pragma once
#include <memory>
#include <chrono>
#include "application/ReconcilePhases.hpp"
#include "domain/ResourceStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ArtifactStorage.hpp"

namespace chartkeeper::application {

/**
 * @struct ReconcilerOptions
 * @brief Scheduling and timeout defaults applied when a spec leaves them out.
 */
struct ReconcilerOptions {
    std::chrono::seconds defaultInterval{600};
    std::chrono::seconds defaultTimeout{60};
    std::chrono::seconds retryInterval{30}; ///< Delay after a retryable failure.
};

/**
 * @class SourceReconciler
 * @brief Drives one pass over a resource: storage check, fetch, outdated check, persistence.
 *
 * Subclasses only provide the fetch step. The status is written back only
 * when the pass changed it, so a pass that finds nothing new performs no
 * writes at all.
 */
class SourceReconciler {
public:
    SourceReconciler(domain::ResourceKind kind,
                     std::shared_ptr<domain::ResourceStore> store,
                     std::shared_ptr<infrastructure::ArtifactStorage> storage,
                     ReconcilerOptions options);
    virtual ~SourceReconciler() = default;

    /**
     * @brief Runs one reconciliation pass.
     * @return The scheduling decision and, on failure, the error.
     * @throws domain::StorageIOError if the status cannot be written back.
     */
    ReconcileOutcome reconcile(const domain::ResourceKey& key);

    /**
     * @brief Removes every stored artifact of a deleted resource.
     */
    ReconcileOutcome reconcileDelete(const domain::ResourceKey& key);

    domain::ResourceKind kind() const { return m_kind; }

protected:
    /**
     * @brief Fetches the current content of the source.
     * @param candidate Filled in when the returned phase does not stop.
     */
    virtual PhaseResult reconcileSource(const domain::ManagedResource& resource,
                                        domain::ResourceStatus status,
                                        SourceCandidate& candidate) = 0;

    /** @brief Maps a transport failure to a FetchFailed reason and a scheduling decision. */
    PhaseResult transportFailure(domain::ResourceStatus status, const domain::TransportError& error,
                                 const std::string& url) const;

    /** @brief Maps a credential failure to FetchFailed (AuthenticationFailed). */
    PhaseResult credentialFailure(domain::ResourceStatus status, const domain::CredentialError& error,
                                  const std::string& ns, const std::string& secretName) const;

    std::chrono::seconds intervalFor(const domain::SourceSpec& spec) const;
    std::chrono::seconds timeoutFor(const domain::SourceSpec& spec) const;

    domain::ResourceKind m_kind;
    std::shared_ptr<domain::ResourceStore> m_store;
    std::shared_ptr<infrastructure::ArtifactStorage> m_storage;
    ReconcilerOptions m_options;
};

} // namespace chartkeeper::application
