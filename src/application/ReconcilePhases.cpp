/**
 * @file ReconcilePhases.cpp
 * @brief Implementation of the shared reconciliation phases.
 */

#include "application/ReconcilePhases.hpp"
#include "infrastructure/ArtifactPaths.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <iostream>

namespace chartkeeper::application {

namespace {

const char* kNoArtifactMessage = "No artifact for resource in storage";

std::string LinkNameFor(domain::ResourceKind kind, const domain::Artifact& artifact) {
    return infrastructure::ArtifactPaths::LatestLinkName(
        kind, infrastructure::ArtifactPaths::Extension(artifact.path));
}

void CollectGarbage(infrastructure::ArtifactStorage& storage, const domain::ManagedResource& resource,
                    const domain::Artifact& current) {
    try {
        auto removed = storage.removeAllButCurrent(current);
        for (const auto& path : removed) {
            std::cout << "[ReconcilePhases] " << resource.displayName()
                      << ": garbage collected " << path << std::endl;
        }
    } catch (const domain::StorageIOError& e) {
        std::cerr << "[ReconcilePhases] " << resource.displayName()
                  << ": garbage collection failed: " << e.what() << std::endl;
    }
}

void MarkReady(domain::ResourceStatus& status, const std::string& revision) {
    status.conditions.remove(domain::kFetchFailedCondition);
    status.conditions.remove(domain::kArtifactOutdatedCondition);
    status.conditions.remove(domain::kArtifactUnavailableCondition);
    status.conditions.markTrue(domain::kReadyCondition, domain::kSucceededReason,
                               "Stored artifact for revision '" + revision + "'");
}

} // namespace

void MarkFetchFailed(domain::ResourceStatus& status, const std::string& reason, const std::string& message) {
    status.conditions.markTrue(domain::kFetchFailedCondition, reason, message);
    status.conditions.markFalse(domain::kReadyCondition, reason, message);
}

PhaseResult FetchFailure(domain::ResourceStatus status, const std::string& reason, const std::string& message,
                         ReconcileResult result, std::optional<std::string> error) {
    MarkFetchFailed(status, reason, message);
    PhaseResult r;
    r.status = std::move(status);
    r.result = result;
    r.error = std::move(error);
    r.stop = true;
    return r;
}

std::string LatestLinkURL(const infrastructure::ArtifactStorage& storage, domain::ResourceKind kind,
                          const domain::Artifact& artifact) {
    std::string dir = std::filesystem::path(artifact.path).parent_path().generic_string();
    return storage.artifactURL(dir + "/" + LinkNameFor(kind, artifact));
}

PhaseResult ReconcileStorage(infrastructure::ArtifactStorage& storage,
                             const domain::ManagedResource& resource,
                             domain::ResourceStatus status) {
    if (!status.artifact) {
        status.url.clear();
        return PhaseResult::Continue(std::move(status));
    }

    if (!storage.exists(*status.artifact)) {
        std::cerr << "[ReconcilePhases] " << resource.displayName() << ": artifact "
                  << status.artifact->path << " is missing from storage" << std::endl;
        status.artifact.reset();
        status.url.clear();
        status.conditions.markTrue(domain::kArtifactUnavailableCondition, domain::kNoArtifactReason,
                                   kNoArtifactMessage);
        status.conditions.markFalse(domain::kReadyCondition, domain::kNoArtifactReason, kNoArtifactMessage);

        PhaseResult r;
        r.status = std::move(status);
        r.result = ReconcileResult::Immediately();
        r.stop = true;
        return r;
    }

    try {
        auto lock = storage.lock(*status.artifact);
        CollectGarbage(storage, resource, *status.artifact);
    } catch (const domain::StorageIOError& e) {
        std::cerr << "[ReconcilePhases] " << resource.displayName()
                  << ": unable to lock artifact for garbage collection: " << e.what() << std::endl;
    }

    // A hostname change only rewrites the status, never the file.
    domain::Artifact artifact = *status.artifact;
    storage.setArtifactURL(artifact);
    if (artifact.url != status.artifact->url) {
        std::cout << "[ReconcilePhases] " << resource.displayName() << ": artifact URL changed to "
                  << artifact.url << std::endl;
        status.artifact = artifact;
    }
    status.url = LatestLinkURL(storage, resource.kind, artifact);

    return PhaseResult::Continue(std::move(status));
}

bool IsUpToDate(const domain::ResourceStatus& status, const SourceCandidate& candidate) {
    return status.artifact && status.artifact->checksum == candidate.checksum &&
           status.artifact->hasRevision(candidate.revision);
}

PhaseResult ReconcileOutdated(domain::ResourceStatus status, const SourceCandidate& candidate) {
    if (!IsUpToDate(status, candidate)) {
        status.conditions.markTrue(domain::kArtifactOutdatedCondition, domain::kNewRevisionReason,
                                   "New " + candidate.label + " revision '" + candidate.revision + "'");
    }
    return PhaseResult::Continue(std::move(status));
}

PhaseResult ReconcileArtifact(infrastructure::ArtifactStorage& storage,
                              const domain::ManagedResource& resource,
                              domain::ResourceStatus status,
                              const SourceCandidate& candidate,
                              std::chrono::seconds interval,
                              std::chrono::seconds retryInterval) {
    if (IsUpToDate(status, candidate)) {
        MarkReady(status, candidate.revision);
        PhaseResult r = PhaseResult::Continue(std::move(status));
        r.result = ReconcileResult::After(interval);
        return r;
    }

    if (candidate.empty) {
        return FetchFailure(std::move(status), candidate.emptyReason, candidate.emptyMessage,
                            ReconcileResult{}, candidate.emptyMessage);
    }

    domain::Artifact artifact = storage.newArtifactFor(resource.kind, resource.key,
                                                       candidate.revision, candidate.filename);
    artifact.checksum = candidate.checksum;

    std::string linkURL;
    try {
        auto lock = storage.lock(artifact);
        storage.ensureDirectory(artifact);
        storage.atomicWrite(artifact, candidate.data);
        linkURL = storage.symlink(artifact, LinkNameFor(resource.kind, artifact));
        CollectGarbage(storage, resource, artifact);
    } catch (const domain::StorageIOError& e) {
        std::string message = "Unable to store artifact for revision '" + candidate.revision +
                              "' of " + resource.displayName() + ": " + e.what();
        return FetchFailure(std::move(status), domain::kStorageOperationFailedReason, message,
                            ReconcileResult::After(retryInterval), message);
    }

    artifact.lastUpdateTime = std::chrono::system_clock::now();
    status.artifact = artifact;
    status.url = linkURL;
    MarkReady(status, candidate.revision);

    std::cout << "[ReconcilePhases] " << resource.displayName() << ": stored " << candidate.label
              << " revision '" << candidate.revision << "' at " << artifact.url << std::endl;

    PhaseResult r = PhaseResult::Continue(std::move(status));
    r.result = ReconcileResult::After(interval);
    return r;
}

} // namespace chartkeeper::application
