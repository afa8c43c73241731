/**
 * @file ChartIndex.hpp
 * @brief Domain entity for a Helm repository index.
 */

#pragma once
#include <string>
#include <vector>
#include <map>

namespace chartkeeper::domain {

/**
 * @struct ChartVersion
 * @brief One packaged version of a chart as listed in the index.
 */
struct ChartVersion {
    std::string name;
    std::string version;
    std::vector<std::string> urls; ///< Download locations, absolute or relative to the repository.
    std::string digest;            ///< Publisher-provided package digest, informational.
    std::string created;
};

/**
 * @brief Orders two version strings by precedence.
 *
 * Dot-separated numeric segments compare numerically, anything else lexically.
 * A pre-release ("1.0.0-rc.1") sorts below its release; build metadata is ignored.
 * @return <0, 0 or >0.
 */
int CompareVersions(const std::string& lhs, const std::string& rhs);

/**
 * @class ChartIndex
 * @brief Parsed repository index with lookup of chart versions.
 */
class ChartIndex {
public:
    std::string apiVersion;
    std::string generated;

    /** @brief Adds a version; entries stay sorted newest first. */
    void add(const ChartVersion& cv);

    /** @brief Re-establishes newest-first order for every chart. */
    void sortEntries();

    /**
     * @brief Finds a chart version.
     * @param name Chart name.
     * @param version Exact version, or empty / "*" for the newest one.
     * @throws ContentError if the chart or the version does not exist.
     */
    const ChartVersion& get(const std::string& name, const std::string& version) const;

    bool has(const std::string& name) const;

    /** @brief True when no chart has any version. */
    bool empty() const;

    const std::map<std::string, std::vector<ChartVersion>>& entries() const { return m_entries; }

private:
    std::map<std::string, std::vector<ChartVersion>> m_entries;
};

} // namespace chartkeeper::domain
