/**
 * @file HelmRepositoryReconciler.cpp
 * @brief Implementation of HelmRepositoryReconciler.
 */

#include "application/HelmRepositoryReconciler.hpp"
#include "infrastructure/ChartIndexLoader.hpp"
#include "infrastructure/Url.hpp"
#include <iostream>

namespace chartkeeper::application {

HelmRepositoryReconciler::HelmRepositoryReconciler(std::shared_ptr<domain::ResourceStore> store,
                                                   std::shared_ptr<infrastructure::ArtifactStorage> storage,
                                                   std::shared_ptr<domain::CredentialResolver> credentials,
                                                   std::shared_ptr<domain::SourceFetcher> fetcher,
                                                   ReconcilerOptions options)
    : SourceReconciler(domain::ResourceKind::HelmRepository, std::move(store), std::move(storage), options),
      m_credentials(std::move(credentials)), m_fetcher(std::move(fetcher)) {}

PhaseResult HelmRepositoryReconciler::reconcileSource(const domain::ManagedResource& resource,
                                                      domain::ResourceStatus status,
                                                      SourceCandidate& candidate) {
    domain::FetchOptions options;
    if (resource.spec.secretRef) {
        try {
            options = m_credentials->resolve(resource.key.ns, *resource.spec.secretRef);
        } catch (const domain::CredentialError& e) {
            return credentialFailure(std::move(status), e, resource.key.ns, *resource.spec.secretRef);
        }
    }

    std::string indexURL = infrastructure::Url::Join(resource.spec.url, "index.yaml");
    std::string bytes;
    try {
        bytes = m_fetcher->fetch(indexURL, options, timeoutFor(resource.spec));
    } catch (const domain::TransportError& e) {
        return transportFailure(std::move(status), e, indexURL);
    }

    domain::ChartIndex index;
    try {
        index = infrastructure::ChartIndexLoader::Parse(bytes);
    } catch (const domain::ContentError& e) {
        std::string message = "Failed to parse index from " + indexURL + ": " + e.what();
        return FetchFailure(std::move(status), domain::kIndexationFailedReason, message, ReconcileResult{}, message);
    }

    candidate.checksum = m_storage->checksum(bytes);
    candidate.revision = candidate.checksum;
    candidate.filename = "index-" + candidate.checksum + ".yaml";
    candidate.data = std::move(bytes);
    candidate.label = "index";
    if (index.empty()) {
        candidate.empty = true;
        candidate.emptyReason = domain::kIndexationFailedReason;
        candidate.emptyMessage = "Index fetched from " + indexURL + " contains no chart entries";
    }

    std::cout << "[HelmRepositoryReconciler] " << resource.displayName() << ": fetched index revision '"
              << candidate.revision << "'" << std::endl;
    return PhaseResult::Continue(std::move(status));
}

} // namespace chartkeeper::application
