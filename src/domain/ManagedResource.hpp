/**
 * @file ManagedResource.hpp
 * @brief Desired and observed state of a declared source (repository or chart).
 */

#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <algorithm>
#include <cctype>
#include "domain/Artifact.hpp"
#include "domain/Conditions.hpp"

namespace chartkeeper::domain {

/**
 * @enum ResourceKind
 * @brief The kinds of source the reconcilers manage.
 */
enum class ResourceKind {
    HelmRepository,
    HelmChart
};

inline std::string KindToString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::HelmRepository: return "HelmRepository";
        case ResourceKind::HelmChart: return "HelmChart";
        default: return "Unknown";
    }
}

inline std::optional<ResourceKind> KindFromString(const std::string& value) {
    if (value == "HelmRepository") return ResourceKind::HelmRepository;
    if (value == "HelmChart") return ResourceKind::HelmChart;
    return std::nullopt;
}

/**
 * @brief Lower-cased kind, used as the first segment of storage paths.
 */
inline std::string KindPathSegment(ResourceKind kind) {
    std::string s = KindToString(kind);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/**
 * @struct ResourceKey
 * @brief Namespaced name identifying a resource of a given kind.
 */
struct ResourceKey {
    std::string ns;
    std::string name;

    std::string toString() const { return ns + "/" + name; }

    bool operator==(const ResourceKey& other) const { return ns == other.ns && name == other.name; }
    bool operator!=(const ResourceKey& other) const { return !(*this == other); }
    bool operator<(const ResourceKey& other) const {
        return ns != other.ns ? ns < other.ns : name < other.name;
    }
};

/**
 * @struct SourceSpec
 * @brief Desired state declared by the client.
 */
struct SourceSpec {
    std::string url;                                   ///< Repository base URL (HelmRepository).
    std::chrono::seconds interval{0};                  ///< Polling interval, 0 selects the configured default.
    std::optional<std::string> secretRef;              ///< Secret name in the resource's namespace.
    std::optional<std::chrono::seconds> timeout;       ///< Fetch timeout override.

    // HelmChart only
    std::string chart;     ///< Chart name in the repository index.
    std::string version;   ///< Exact version, or empty / "*" for the newest.
    std::string sourceRef; ///< HelmRepository name in the same namespace.

    bool operator==(const SourceSpec& other) const {
        return url == other.url && interval == other.interval && secretRef == other.secretRef &&
               timeout == other.timeout && chart == other.chart && version == other.version &&
               sourceRef == other.sourceRef;
    }
};

/**
 * @struct ResourceStatus
 * @brief Observed state written back by the reconcilers.
 */
struct ResourceStatus {
    std::optional<Artifact> artifact; ///< Current artifact, at most one.
    std::string url;                  ///< Stable-name link URL of the current artifact.
    ConditionSet conditions;
    long long observedGeneration = 0;

    bool operator==(const ResourceStatus& other) const {
        return artifact == other.artifact && url == other.url &&
               conditions == other.conditions && observedGeneration == other.observedGeneration;
    }
    bool operator!=(const ResourceStatus& other) const { return !(*this == other); }
};

/**
 * @struct ManagedResource
 * @brief A declared source as read from the resource store.
 */
struct ManagedResource {
    ResourceKind kind = ResourceKind::HelmRepository;
    ResourceKey key;
    long long generation = 1;
    SourceSpec spec;
    ResourceStatus status;

    /** @brief "HelmRepository/default/podinfo" style identifier for log lines. */
    std::string displayName() const { return KindToString(kind) + "/" + key.toString(); }
};

} // namespace chartkeeper::domain
