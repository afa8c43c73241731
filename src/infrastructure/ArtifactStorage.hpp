/**
 * @file ArtifactStorage.hpp
 * @brief Content-versioned on-disk artifact cache with atomic writes and per-resource locking.
 */

#pragma once
#include <string>
#include <vector>
#include <mutex>
#include "domain/Artifact.hpp"
#include "domain/ManagedResource.hpp"
#include "infrastructure/FileLock.hpp"

namespace chartkeeper::infrastructure {

/**
 * @class ArtifactStorage
 * @brief Owns the storage root shared by every reconciler.
 *
 * One instance is created by the host and injected into each reconciler.
 * Artifacts of one resource live together in
 * "<root>/<kind>/<namespace>/<name>/", which is also the unit of locking
 * and garbage collection. All methods are safe to call concurrently.
 */
class ArtifactStorage {
public:
    /**
     * @param basePath Storage root directory, created if missing. A relative
     *        path is resolved against the current working directory.
     * @param hostname Public base address, e.g. "http://chartkeeper.local".
     */
    ArtifactStorage(std::string basePath, std::string hostname);

    /** @brief Builds an artifact record for a resource, with its URL already derived. */
    domain::Artifact newArtifactFor(domain::ResourceKind kind, const domain::ResourceKey& key,
                                    const std::string& revision, const std::string& filename) const;

    /**
     * @brief Creates every parent directory of the artifact. Idempotent.
     * @throws domain::StorageIOError
     */
    void ensureDirectory(const domain::Artifact& artifact) const;

    /**
     * @brief Writes data next to the destination, then renames it into place.
     *
     * Observers see either the previous file or the complete new one. The
     * temporary file is removed on every failure path.
     * @throws domain::StorageIOError
     */
    void atomicWrite(const domain::Artifact& artifact, const std::string& data, unsigned int mode = 0644) const;

    /** @brief SHA-256 hex digest of data. */
    std::string checksum(const std::string& data) const;

    /** @brief True iff a regular file backs the artifact. */
    bool exists(const domain::Artifact& artifact) const;

    /**
     * @brief Acquires the exclusive lock of the artifact's resource directory.
     * @throws domain::StorageIOError
     */
    ArtifactLock lock(const domain::Artifact& artifact);

    /**
     * @brief Deletes every regular file in the artifact's directory except its own.
     *
     * Links and sub-directories are kept; siblings that vanished meanwhile are
     * ignored. Callers hold the artifact lock.
     * @return Storage-relative paths of the removed files.
     * @throws domain::StorageIOError on unexpected failures.
     */
    std::vector<std::string> removeAllButCurrent(const domain::Artifact& current) const;

    /**
     * @brief Deletes the artifact's whole resource directory.
     * @throws domain::StorageIOError
     */
    void removeAll(const domain::Artifact& artifact);

    /**
     * @brief Atomically (re)points "<dir>/<linkName>" at the artifact.
     * @return Public URL of the link.
     * @throws domain::StorageIOError
     */
    std::string symlink(const domain::Artifact& artifact, const std::string& linkName) const;

    /** @brief Rewrites artifact.url from the current hostname and artifact.path. */
    void setArtifactURL(domain::Artifact& artifact) const;

    /** @brief Public URL of a storage-relative path under the current hostname. */
    std::string artifactURL(const std::string& path) const;

    void setHostname(const std::string& hostname);
    std::string hostname() const;

    /**
     * @brief Absolute path of the artifact's backing file.
     * @throws domain::StorageIOError if the path escapes the storage root.
     */
    std::string localPath(const domain::Artifact& artifact) const;

    /**
     * @brief Reads the artifact's bytes.
     * @throws domain::StorageIOError
     */
    std::string readFile(const domain::Artifact& artifact) const;

    const std::string& basePath() const { return m_basePath; }

private:
    std::string lockPath(const domain::Artifact& artifact) const;
    std::string resolve(const std::string& relativePath) const;

    std::string m_basePath;
    std::string m_hostname;
    mutable std::mutex m_hostMutex;
    FileLockManager m_locks;
};

} // namespace chartkeeper::infrastructure
