/**
 * @file FileLock.hpp
 * @brief Exclusive per-path locks shared between threads and processes.
 */

#pragma once
#include <string>
#include <map>
#include <memory>
#include <mutex>

namespace chartkeeper::infrastructure {

class FileLockManager;

/**
 * @class ArtifactLock
 * @brief Movable RAII handle for an acquired lock. Releases on destruction.
 */
class ArtifactLock {
public:
    ArtifactLock() = default;
    ArtifactLock(ArtifactLock&& other) noexcept;
    ArtifactLock& operator=(ArtifactLock&& other) noexcept;
    ArtifactLock(const ArtifactLock&) = delete;
    ArtifactLock& operator=(const ArtifactLock&) = delete;
    ~ArtifactLock();

    /** @brief Releases the lock early. Safe to call more than once. */
    void release();

    bool ownsLock() const { return m_manager != nullptr; }
    const std::string& key() const { return m_key; }

private:
    friend class FileLockManager;
    ArtifactLock(FileLockManager* manager, std::string key, int fd);

    FileLockManager* m_manager = nullptr;
    std::string m_key;
    int m_fd = -1;
};

/**
 * @class FileLockManager
 * @brief Lock table keyed by lock-file path.
 *
 * Threads of this process queue on an in-memory mutex per key; the holder
 * then takes flock(LOCK_EX) on the lock file so other processes sharing the
 * storage root are excluded too. The advisory lock dies with its process.
 * The manager must outlive every lock it hands out.
 */
class FileLockManager {
public:
    FileLockManager() = default;
    FileLockManager(const FileLockManager&) = delete;
    FileLockManager& operator=(const FileLockManager&) = delete;

    /**
     * @brief Blocks until the lock for lockPath is held.
     * @throws domain::StorageIOError if the lock file cannot be opened or locked.
     */
    ArtifactLock acquire(const std::string& lockPath);

    /** @brief Number of keys currently held or waited on. */
    size_t activeKeys() const;

private:
    friend class ArtifactLock;

    struct Entry {
        std::mutex mutex;
        int refs = 0;
    };

    Entry& retain(const std::string& key);
    void releaseEntry(const std::string& key);
    void release(const std::string& key, int fd);

    mutable std::mutex m_tableMutex;
    std::map<std::string, std::unique_ptr<Entry>> m_table;
};

} // namespace chartkeeper::infrastructure
