/**
 * @file FileLock.cpp
 * @brief Implementation of FileLockManager and ArtifactLock.
 */

#include "infrastructure/FileLock.hpp"
#include "domain/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace chartkeeper::infrastructure {

namespace fs = std::filesystem;

ArtifactLock::ArtifactLock(FileLockManager* manager, std::string key, int fd)
    : m_manager(manager), m_key(std::move(key)), m_fd(fd) {}

ArtifactLock::ArtifactLock(ArtifactLock&& other) noexcept
    : m_manager(other.m_manager), m_key(std::move(other.m_key)), m_fd(other.m_fd) {
    other.m_manager = nullptr;
    other.m_fd = -1;
}

ArtifactLock& ArtifactLock::operator=(ArtifactLock&& other) noexcept {
    if (this != &other) {
        release();
        m_manager = other.m_manager;
        m_key = std::move(other.m_key);
        m_fd = other.m_fd;
        other.m_manager = nullptr;
        other.m_fd = -1;
    }
    return *this;
}

ArtifactLock::~ArtifactLock() {
    release();
}

void ArtifactLock::release() {
    if (!m_manager) return;
    m_manager->release(m_key, m_fd);
    m_manager = nullptr;
    m_fd = -1;
}

FileLockManager::Entry& FileLockManager::retain(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    auto& slot = m_table[key];
    if (!slot) slot = std::make_unique<Entry>();
    ++slot->refs;
    return *slot;
}

void FileLockManager::releaseEntry(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    auto it = m_table.find(key);
    if (it == m_table.end()) return;
    if (--it->second->refs == 0) {
        m_table.erase(it);
    }
}

ArtifactLock FileLockManager::acquire(const std::string& lockPath) {
    // Entries are only erased once refs drops to zero, so the reference stays valid.
    Entry& entry = retain(lockPath);
    entry.mutex.lock();

    int fd = -1;
    try {
        fs::path p(lockPath);
        if (p.has_parent_path()) {
            fs::create_directories(p.parent_path());
        }

        fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw domain::StorageIOError("unable to open lock file '" + lockPath + "': " + std::strerror(errno));
        }

        int rc;
        do {
            rc = ::flock(fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd);
            throw domain::StorageIOError("unable to lock '" + lockPath + "': " + std::strerror(err));
        }
    } catch (const fs::filesystem_error& e) {
        entry.mutex.unlock();
        releaseEntry(lockPath);
        throw domain::StorageIOError("unable to create lock directory for '" + lockPath + "': " + e.what());
    } catch (...) {
        entry.mutex.unlock();
        releaseEntry(lockPath);
        throw;
    }

    return ArtifactLock(this, lockPath, fd);
}

void FileLockManager::release(const std::string& key, int fd) {
    if (fd >= 0) {
        if (::flock(fd, LOCK_UN) != 0) {
            std::cerr << "[FileLockManager] Unlock failed for " << key << ": " << std::strerror(errno) << std::endl;
        }
        ::close(fd);
    }

    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_tableMutex);
        auto it = m_table.find(key);
        if (it != m_table.end()) entry = it->second.get();
    }
    if (entry) entry->mutex.unlock();
    releaseEntry(key);
}

size_t FileLockManager::activeKeys() const {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    return m_table.size();
}

} // namespace chartkeeper::infrastructure
