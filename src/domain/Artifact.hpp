/**
 * @file Artifact.hpp
 * @brief Domain value representing one persisted revision of a resource's content.
 */

#pragma once
#include <string>
#include <chrono>

namespace chartkeeper::domain {

/**
 * @struct Artifact
 * @brief A checksummed, URL-addressable file inside the storage root.
 *
 * A record is only meaningful while a file exists at @ref path; one without a
 * backing file is stale and treated as absent.
 */
struct Artifact {
    std::string path;     ///< Storage-relative location, POSIX segments, no leading slash.
    std::string revision; ///< Opaque content-version identifier.
    std::string checksum; ///< SHA-256 hex digest of the file at path.
    std::string url;      ///< Derived from the configured hostname and path, never cached.
    std::chrono::system_clock::time_point lastUpdateTime{};

    /** @brief True when this record describes the given revision. */
    bool hasRevision(const std::string& rev) const {
        return revision == rev;
    }

    bool operator==(const Artifact& other) const {
        return path == other.path && revision == other.revision &&
               checksum == other.checksum && url == other.url &&
               lastUpdateTime == other.lastUpdateTime;
    }
    bool operator!=(const Artifact& other) const { return !(*this == other); }
};

} // namespace chartkeeper::domain
