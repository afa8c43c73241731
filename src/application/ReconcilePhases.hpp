/**
 * @file ReconcilePhases.hpp
 * @brief Reconciliation phases shared by the repository and chart reconcilers.
 */

#pragma once
#include <string>
#include <chrono>
#include "application/ReconcileResult.hpp"
#include "domain/ManagedResource.hpp"
#include "infrastructure/ArtifactStorage.hpp"

namespace chartkeeper::application {

/**
 * @struct SourceCandidate
 * @brief Freshly fetched content waiting to be compared and persisted.
 */
struct SourceCandidate {
    std::string revision;
    std::string checksum;
    std::string filename;      ///< Revision-qualified file name inside the resource directory.
    std::string data;
    std::string label;         ///< "index" or "chart", used in messages.
    bool empty = false;        ///< Nothing resolvable was fetched.
    std::string emptyReason;   ///< Condition reason used when empty.
    std::string emptyMessage;
};

/**
 * @brief Asserts FetchFailed and lowers Ready with the same reason and message.
 */
void MarkFetchFailed(domain::ResourceStatus& status, const std::string& reason, const std::string& message);

/**
 * @brief Builds the phase result of a failed fetch.
 * @param error Error handed back to the queue, if any.
 */
PhaseResult FetchFailure(domain::ResourceStatus status, const std::string& reason, const std::string& message,
                         ReconcileResult result, std::optional<std::string> error);

/**
 * @brief Checks that the recorded artifact is still backed by a file.
 *
 * A stale record is dropped, ArtifactUnavailable is asserted and an immediate
 * requeue is requested. For a live artifact, superseded revisions are
 * garbage-collected (failures are only logged) and both URLs are re-derived
 * from the current hostname.
 */
PhaseResult ReconcileStorage(infrastructure::ArtifactStorage& storage,
                             const domain::ManagedResource& resource,
                             domain::ResourceStatus status);

/** @brief True when the recorded artifact already holds the candidate. */
bool IsUpToDate(const domain::ResourceStatus& status, const SourceCandidate& candidate);

/**
 * @brief Asserts ArtifactOutdated when the candidate differs from the recorded artifact.
 */
PhaseResult ReconcileOutdated(domain::ResourceStatus status, const SourceCandidate& candidate);

/**
 * @brief Persists the candidate and publishes it in the status.
 *
 * Write, link and garbage collection run under the resource lock. A storage
 * failure leaves the previous artifact in place and asks for a retry.
 */
PhaseResult ReconcileArtifact(infrastructure::ArtifactStorage& storage,
                              const domain::ManagedResource& resource,
                              domain::ResourceStatus status,
                              const SourceCandidate& candidate,
                              std::chrono::seconds interval,
                              std::chrono::seconds retryInterval);

/** @brief URL of the stable "<kind>-latest.<ext>" link next to an artifact. */
std::string LatestLinkURL(const infrastructure::ArtifactStorage& storage, domain::ResourceKind kind,
                          const domain::Artifact& artifact);

} // namespace chartkeeper::application
