/**
 * @file HelmRepositoryReconciler.hpp
 * @brief Keeps the repository index of each HelmRepository cached in storage.
 */

#pragma once
#include <memory>
#include "application/SourceReconciler.hpp"
#include "domain/SourceFetcher.hpp"

namespace chartkeeper::application {

/**
 * @class HelmRepositoryReconciler
 * @brief Fetches "<url>/index.yaml", validates it and stores it as "index-<checksum>.yaml".
 *
 * The revision of a repository is the checksum of its index bytes.
 */
class HelmRepositoryReconciler : public SourceReconciler {
public:
    HelmRepositoryReconciler(std::shared_ptr<domain::ResourceStore> store,
                             std::shared_ptr<infrastructure::ArtifactStorage> storage,
                             std::shared_ptr<domain::CredentialResolver> credentials,
                             std::shared_ptr<domain::SourceFetcher> fetcher,
                             ReconcilerOptions options = {});

protected:
    PhaseResult reconcileSource(const domain::ManagedResource& resource,
                                domain::ResourceStatus status,
                                SourceCandidate& candidate) override;

private:
    std::shared_ptr<domain::CredentialResolver> m_credentials;
    std::shared_ptr<domain::SourceFetcher> m_fetcher;
};

} // namespace chartkeeper::application
