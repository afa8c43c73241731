/**
 * @file SourceReconciler.cpp
 * @brief Implementation of SourceReconciler.
 */

#include "application/SourceReconciler.hpp"
#include "infrastructure/ArtifactPaths.hpp"
#include <iostream>

namespace chartkeeper::application {

SourceReconciler::SourceReconciler(domain::ResourceKind kind,
                                   std::shared_ptr<domain::ResourceStore> store,
                                   std::shared_ptr<infrastructure::ArtifactStorage> storage,
                                   ReconcilerOptions options)
    : m_kind(kind), m_store(std::move(store)), m_storage(std::move(storage)), m_options(options) {}

std::chrono::seconds SourceReconciler::intervalFor(const domain::SourceSpec& spec) const {
    return spec.interval.count() > 0 ? spec.interval : m_options.defaultInterval;
}

std::chrono::seconds SourceReconciler::timeoutFor(const domain::SourceSpec& spec) const {
    return (spec.timeout && spec.timeout->count() > 0) ? *spec.timeout : m_options.defaultTimeout;
}

ReconcileOutcome SourceReconciler::reconcile(const domain::ResourceKey& key) {
    auto resource = m_store->get(m_kind, key);
    if (!resource) {
        std::cout << "[" << domain::KindToString(m_kind) << "Reconciler] " << key.toString()
                  << " not found, skipping" << std::endl;
        return {};
    }
    const std::string tag = "[" + domain::KindToString(m_kind) + "Reconciler] ";
    const domain::ResourceStatus original = resource->status;

    auto phase = [&]() -> PhaseResult {
        PhaseResult storagePhase = ReconcileStorage(*m_storage, *resource, resource->status);
        if (storagePhase.stop) return storagePhase;

        SourceCandidate candidate;
        PhaseResult sourcePhase = reconcileSource(*resource, storagePhase.status, candidate);
        if (sourcePhase.stop) return sourcePhase;

        PhaseResult outdatedPhase = ReconcileOutdated(std::move(sourcePhase.status), candidate);
        return ReconcileArtifact(*m_storage, *resource, std::move(outdatedPhase.status), candidate,
                                 intervalFor(resource->spec), m_options.retryInterval);
    }();

    phase.status.observedGeneration = resource->generation;

    if (phase.status != original) {
        if (!m_store->updateStatus(m_kind, key, phase.status)) {
            std::cout << tag << key.toString() << " was deleted during reconciliation" << std::endl;
            return {};
        }
    }

    if (phase.error) {
        std::cerr << tag << key.toString() << ": reconciliation failed: " << *phase.error << std::endl;
    } else if (phase.result.requeue) {
        std::cout << tag << key.toString() << ": requeued immediately" << std::endl;
    }

    ReconcileOutcome outcome;
    outcome.result = phase.result;
    outcome.error = std::move(phase.error);
    return outcome;
}

ReconcileOutcome SourceReconciler::reconcileDelete(const domain::ResourceKey& key) {
    const std::string tag = "[" + domain::KindToString(m_kind) + "Reconciler] ";
    // Any file name locates the resource directory.
    domain::Artifact artifact = m_storage->newArtifactFor(
        m_kind, key, "", infrastructure::ArtifactPaths::LatestLinkName(m_kind, ""));

    ReconcileOutcome outcome;
    try {
        m_storage->removeAll(artifact);
        std::cout << tag << key.toString() << ": removed stored artifacts" << std::endl;
    } catch (const domain::StorageIOError& e) {
        std::cerr << tag << key.toString() << ": unable to remove artifacts: " << e.what() << std::endl;
        outcome.result = ReconcileResult::After(m_options.retryInterval);
        outcome.error = std::string(e.what());
    }
    return outcome;
}

PhaseResult SourceReconciler::transportFailure(domain::ResourceStatus status, const domain::TransportError& error,
                                               const std::string& url) const {
    std::string message = "Failed to fetch " + url + ": " + error.what();
    switch (error.kind()) {
        case domain::TransportError::Kind::InvalidURL:
            return FetchFailure(std::move(status), domain::kURLInvalidReason, message, ReconcileResult{}, std::nullopt);
        case domain::TransportError::Kind::UnsupportedScheme:
            return FetchFailure(std::move(status), domain::kFailedReason, message, ReconcileResult{}, std::nullopt);
        default:
            return FetchFailure(std::move(status), domain::kFailedReason, message,
                                ReconcileResult::After(m_options.retryInterval), message);
    }
}

PhaseResult SourceReconciler::credentialFailure(domain::ResourceStatus status, const domain::CredentialError& error,
                                                const std::string& ns, const std::string& secretName) const {
    std::string message = "Failed to get credentials from secret '" + ns + "/" + secretName + "': " + error.what();
    return FetchFailure(std::move(status), domain::kAuthenticationFailedReason, message, ReconcileResult{}, message);
}

} // namespace chartkeeper::application
