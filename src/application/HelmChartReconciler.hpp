/**
 * @file HelmChartReconciler.hpp
 * @brief Keeps the packaged chart selected by each HelmChart cached in storage.
 */

#pragma once
#include <memory>
#include "application/SourceReconciler.hpp"
#include "domain/SourceFetcher.hpp"

namespace chartkeeper::application {

/**
 * @class HelmChartReconciler
 * @brief Resolves a chart version through its HelmRepository's cached index and stores the package.
 *
 * The chart is looked up in the index artifact of the referenced repository
 * (same namespace), downloaded with the repository's credentials and timeout,
 * and stored as "<chart>-<version>-<checksum>.tgz". The revision is the chart
 * version.
 */
class HelmChartReconciler : public SourceReconciler {
public:
    HelmChartReconciler(std::shared_ptr<domain::ResourceStore> store,
                        std::shared_ptr<infrastructure::ArtifactStorage> storage,
                        std::shared_ptr<domain::CredentialResolver> credentials,
                        std::shared_ptr<domain::SourceFetcher> fetcher,
                        ReconcilerOptions options = {});

protected:
    PhaseResult reconcileSource(const domain::ManagedResource& resource,
                                domain::ResourceStatus status,
                                SourceCandidate& candidate) override;

private:
    PhaseResult sourceUnavailable(domain::ResourceStatus status, const std::string& message) const;

    std::shared_ptr<domain::CredentialResolver> m_credentials;
    std::shared_ptr<domain::SourceFetcher> m_fetcher;
};

} // namespace chartkeeper::application
