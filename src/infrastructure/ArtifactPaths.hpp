/**
 * @file ArtifactPaths.hpp
 * @brief Deterministic mapping from resource identity to storage paths and public URLs.
 */

#pragma once
#include <string>
#include "domain/ManagedResource.hpp"

namespace chartkeeper::infrastructure {

class ArtifactPaths {
public:
    /**
     * @brief Storage-relative path of an artifact file.
     * @return "<kind>/<namespace>/<name>/<filename>", kind lower-cased.
     */
    static std::string ArtifactPath(domain::ResourceKind kind, const domain::ResourceKey& key,
                                    const std::string& filename);

    /** @brief Storage-relative directory holding every revision of one resource. */
    static std::string ArtifactDir(domain::ResourceKind kind, const domain::ResourceKey& key);

    /** @brief "<hostname>/<path>" joined by exactly one slash. */
    static std::string ArtifactURL(const std::string& hostname, const std::string& path);

    /** @brief Stable link name for a kind: "<kind>-latest.<ext>". */
    static std::string LatestLinkName(domain::ResourceKind kind, const std::string& extension);

    /** @brief Extension of a filename without the dot ("tgz", "yaml"), empty if none. */
    static std::string Extension(const std::string& filename);
};

} // namespace chartkeeper::infrastructure
