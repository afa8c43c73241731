/**
 * @file HelmChartReconciler.cpp
 * @brief Implementation of HelmChartReconciler.
 */

#include "application/HelmChartReconciler.hpp"
#include "infrastructure/ChartIndexLoader.hpp"
#include "infrastructure/Url.hpp"
#include <iostream>

namespace chartkeeper::application {

HelmChartReconciler::HelmChartReconciler(std::shared_ptr<domain::ResourceStore> store,
                                         std::shared_ptr<infrastructure::ArtifactStorage> storage,
                                         std::shared_ptr<domain::CredentialResolver> credentials,
                                         std::shared_ptr<domain::SourceFetcher> fetcher,
                                         ReconcilerOptions options)
    : SourceReconciler(domain::ResourceKind::HelmChart, std::move(store), std::move(storage), options),
      m_credentials(std::move(credentials)), m_fetcher(std::move(fetcher)) {}

PhaseResult HelmChartReconciler::sourceUnavailable(domain::ResourceStatus status, const std::string& message) const {
    return FetchFailure(std::move(status), domain::kSourceUnavailableReason, message,
                        ReconcileResult::After(m_options.retryInterval), message);
}

PhaseResult HelmChartReconciler::reconcileSource(const domain::ManagedResource& resource,
                                                 domain::ResourceStatus status,
                                                 SourceCandidate& candidate) {
    const auto& spec = resource.spec;
    domain::ResourceKey repoKey{resource.key.ns, spec.sourceRef};

    auto repository = m_store->get(domain::ResourceKind::HelmRepository, repoKey);
    if (!repository) {
        return sourceUnavailable(std::move(status),
                                 "HelmRepository '" + repoKey.toString() + "' not found");
    }
    if (!repository->status.artifact || !repository->status.conditions.isTrue(domain::kReadyCondition)) {
        return sourceUnavailable(std::move(status),
                                 "HelmRepository '" + repoKey.toString() + "' is not ready");
    }

    domain::ChartIndex index;
    try {
        index = infrastructure::ChartIndexLoader::Parse(m_storage->readFile(*repository->status.artifact));
    } catch (const domain::StorageIOError& e) {
        return sourceUnavailable(std::move(status),
                                 "Unable to read index of HelmRepository '" + repoKey.toString() + "': " + e.what());
    } catch (const domain::ContentError& e) {
        std::string message = "Unable to load index of HelmRepository '" + repoKey.toString() + "': " + e.what();
        return FetchFailure(std::move(status), domain::kChartPullFailedReason, message, ReconcileResult{}, message);
    }

    domain::ChartVersion chartVersion;
    try {
        chartVersion = index.get(spec.chart, spec.version);
    } catch (const domain::ContentError& e) {
        return FetchFailure(std::move(status), domain::kChartPullFailedReason, e.what(), ReconcileResult{},
                            std::string(e.what()));
    }
    if (chartVersion.urls.empty()) {
        std::string message = "Chart '" + spec.chart + "' version '" + chartVersion.version +
                              "' has no downloadable URLs";
        return FetchFailure(std::move(status), domain::kChartPullFailedReason, message, ReconcileResult{}, message);
    }

    domain::FetchOptions options;
    const auto& repoSpec = repository->spec;
    if (repoSpec.secretRef) {
        try {
            options = m_credentials->resolve(repoKey.ns, *repoSpec.secretRef);
        } catch (const domain::CredentialError& e) {
            return credentialFailure(std::move(status), e, repoKey.ns, *repoSpec.secretRef);
        }
    }

    std::string downloadURL = chartVersion.urls.front();
    std::string bytes;
    try {
        downloadURL = infrastructure::Url::ResolveReference(repoSpec.url, chartVersion.urls.front());
        bytes = m_fetcher->fetch(downloadURL, options, timeoutFor(repoSpec));
    } catch (const domain::TransportError& e) {
        return transportFailure(std::move(status), e, downloadURL);
    }

    candidate.checksum = m_storage->checksum(bytes);
    candidate.revision = chartVersion.version;
    candidate.filename = chartVersion.name + "-" + chartVersion.version + "-" + candidate.checksum + ".tgz";
    candidate.data = std::move(bytes);
    candidate.label = "chart";
    if (candidate.data.empty()) {
        candidate.empty = true;
        candidate.emptyReason = domain::kChartPullFailedReason;
        candidate.emptyMessage = "Chart package downloaded from " + downloadURL + " is empty";
    }

    std::cout << "[HelmChartReconciler] " << resource.displayName() << ": pulled chart '" << spec.chart
              << "' version '" << chartVersion.version << "'" << std::endl;
    return PhaseResult::Continue(std::move(status));
}

} // namespace chartkeeper::application
