/**
 * @file ArtifactStorage.cpp
 * @brief Implementation of ArtifactStorage.
 */

#include "infrastructure/ArtifactStorage.hpp"
#include "infrastructure/ArtifactPaths.hpp"
#include "infrastructure/Checksum.hpp"
#include "domain/Errors.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace chartkeeper::infrastructure {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> g_tempCounter{0};

/// Unique sibling name for in-flight files: ".<name>.tmp-<pid>-<n>".
fs::path TempSibling(const fs::path& finalPath) {
    std::ostringstream name;
    name << "." << finalPath.filename().string() << ".tmp-" << ::getpid() << "-" << g_tempCounter++;
    return finalPath.parent_path() / name.str();
}

/// Removes the temporary file unless the write was committed.
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : m_path(std::move(path)) {}
    ~TempFileGuard() {
        if (m_fd >= 0) ::close(m_fd);
        if (!m_committed) {
            std::error_code ec;
            fs::remove(m_path, ec);
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void setFd(int fd) { m_fd = fd; }
    int closeFd() {
        int rc = ::close(m_fd);
        m_fd = -1;
        return rc;
    }
    void commit() { m_committed = true; }

private:
    fs::path m_path;
    int m_fd = -1;
    bool m_committed = false;
};

std::string ErrnoMessage(const std::string& what, const fs::path& path) {
    return what + " '" + path.string() + "': " + std::strerror(errno);
}

} // namespace

ArtifactStorage::ArtifactStorage(std::string basePath, std::string hostname)
    : m_hostname(std::move(hostname)) {
    // Link targets are absolute, so a relative root is anchored at the working directory.
    std::error_code ec;
    fs::path root = fs::absolute(basePath, ec);
    if (ec) {
        throw domain::StorageIOError("unable to resolve storage root '" + basePath + "': " + ec.message());
    }
    m_basePath = root.lexically_normal().string();
    while (m_basePath.size() > 1 && m_basePath.back() == '/') m_basePath.pop_back();
    fs::create_directories(m_basePath, ec);
    if (ec) {
        throw domain::StorageIOError("unable to create storage root '" + m_basePath + "': " + ec.message());
    }
}

domain::Artifact ArtifactStorage::newArtifactFor(domain::ResourceKind kind, const domain::ResourceKey& key,
                                                 const std::string& revision, const std::string& filename) const {
    domain::Artifact artifact;
    artifact.path = ArtifactPaths::ArtifactPath(kind, key, filename);
    artifact.revision = revision;
    setArtifactURL(artifact);
    return artifact;
}

std::string ArtifactStorage::resolve(const std::string& relativePath) const {
    fs::path rel = fs::path(relativePath).lexically_normal();
    if (rel.has_root_path()) {
        rel = rel.relative_path();
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw domain::StorageIOError("path '" + relativePath + "' escapes the storage root");
        }
    }
    return (fs::path(m_basePath) / rel).string();
}

std::string ArtifactStorage::localPath(const domain::Artifact& artifact) const {
    return resolve(artifact.path);
}

std::string ArtifactStorage::lockPath(const domain::Artifact& artifact) const {
    fs::path dir = fs::path(localPath(artifact)).parent_path();
    if (dir.lexically_normal() == fs::path(m_basePath).lexically_normal()) {
        return (dir / ".root.lock").string();
    }
    fs::path lockFile = dir;
    lockFile += ".lock";
    return lockFile.string();
}

void ArtifactStorage::ensureDirectory(const domain::Artifact& artifact) const {
    fs::path dir = fs::path(localPath(artifact)).parent_path();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw domain::StorageIOError("unable to create directory '" + dir.string() + "': " + ec.message());
    }
}

void ArtifactStorage::atomicWrite(const domain::Artifact& artifact, const std::string& data, unsigned int mode) const {
    fs::path finalPath = localPath(artifact);
    ensureDirectory(artifact);

    fs::path tempPath = TempSibling(finalPath);
    TempFileGuard guard(tempPath);

    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw domain::StorageIOError(ErrnoMessage("unable to create temporary file", tempPath));
    }
    guard.setFd(fd);

    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw domain::StorageIOError(ErrnoMessage("write failed for", tempPath));
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        throw domain::StorageIOError(ErrnoMessage("chmod failed for", tempPath));
    }
    if (::fsync(fd) != 0) {
        throw domain::StorageIOError(ErrnoMessage("fsync failed for", tempPath));
    }
    if (guard.closeFd() != 0) {
        throw domain::StorageIOError(ErrnoMessage("close failed for", tempPath));
    }

    if (::rename(tempPath.c_str(), finalPath.c_str()) != 0) {
        throw domain::StorageIOError("rename '" + tempPath.string() + "' -> '" + finalPath.string() +
                                     "' failed: " + std::strerror(errno));
    }
    guard.commit();
}

std::string ArtifactStorage::checksum(const std::string& data) const {
    return Checksum::Sha256(data);
}

bool ArtifactStorage::exists(const domain::Artifact& artifact) const {
    if (artifact.path.empty()) return false;
    try {
        std::error_code ec;
        auto st = fs::symlink_status(localPath(artifact), ec);
        return !ec && fs::is_regular_file(st);
    } catch (const domain::StorageIOError&) {
        return false;
    }
}

ArtifactLock ArtifactStorage::lock(const domain::Artifact& artifact) {
    return m_locks.acquire(lockPath(artifact));
}

std::vector<std::string> ArtifactStorage::removeAllButCurrent(const domain::Artifact& current) const {
    std::vector<std::string> removed;
    fs::path currentPath = localPath(current);
    fs::path dir = currentPath.parent_path();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) return removed;
        throw domain::StorageIOError("unable to list '" + dir.string() + "': " + ec.message());
    }

    fs::path relDir = fs::path(current.path).parent_path();
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        if (p == currentPath) continue;

        std::error_code stEc;
        auto st = fs::symlink_status(p, stEc);
        if (stEc || fs::is_symlink(st) || !fs::is_regular_file(st)) continue;

        std::error_code rmEc;
        fs::remove(p, rmEc);
        if (rmEc && rmEc != std::errc::no_such_file_or_directory) {
            throw domain::StorageIOError("unable to remove '" + p.string() + "': " + rmEc.message());
        }
        if (!rmEc) {
            removed.push_back((relDir / p.filename()).generic_string());
        }
    }
    if (ec) {
        throw domain::StorageIOError("unable to iterate '" + dir.string() + "': " + ec.message());
    }
    return removed;
}

void ArtifactStorage::removeAll(const domain::Artifact& artifact) {
    fs::path dir = fs::path(localPath(artifact)).parent_path();
    if (dir.lexically_normal() == fs::path(m_basePath).lexically_normal()) {
        throw domain::StorageIOError("refusing to remove the storage root for '" + artifact.path + "'");
    }
    auto guard = lock(artifact);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw domain::StorageIOError("unable to remove '" + dir.string() + "': " + ec.message());
    }
}

std::string ArtifactStorage::symlink(const domain::Artifact& artifact, const std::string& linkName) const {
    fs::path target = localPath(artifact);
    fs::path linkPath = target.parent_path() / linkName;
    fs::path tempLink = TempSibling(linkPath);

    if (::symlink(target.c_str(), tempLink.c_str()) != 0) {
        throw domain::StorageIOError(ErrnoMessage("unable to create link", tempLink));
    }
    if (::rename(tempLink.c_str(), linkPath.c_str()) != 0) {
        std::string message = ErrnoMessage("unable to replace link", linkPath);
        std::error_code ec;
        fs::remove(tempLink, ec);
        throw domain::StorageIOError(message);
    }

    std::string relLink = (fs::path(artifact.path).parent_path() / linkName).generic_string();
    return artifactURL(relLink);
}

void ArtifactStorage::setArtifactURL(domain::Artifact& artifact) const {
    if (artifact.path.empty()) return;
    artifact.url = artifactURL(artifact.path);
}

std::string ArtifactStorage::artifactURL(const std::string& path) const {
    return ArtifactPaths::ArtifactURL(hostname(), path);
}

void ArtifactStorage::setHostname(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(m_hostMutex);
    m_hostname = hostname;
}

std::string ArtifactStorage::hostname() const {
    std::lock_guard<std::mutex> lock(m_hostMutex);
    return m_hostname;
}

std::string ArtifactStorage::readFile(const domain::Artifact& artifact) const {
    std::string path = localPath(artifact);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw domain::StorageIOError("unable to open '" + path + "'");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw domain::StorageIOError("read failed for '" + path + "'");
    }
    return buffer.str();
}

} // namespace chartkeeper::infrastructure
