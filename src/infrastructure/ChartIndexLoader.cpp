/**
 * @file ChartIndexLoader.cpp
 * @brief Implementation of ChartIndexLoader.
 */

#include "infrastructure/ChartIndexLoader.hpp"
#include "domain/Errors.hpp"
#include <yaml-cpp/yaml.h>

namespace chartkeeper::infrastructure {

namespace {

std::string ScalarOr(const YAML::Node& node, const char* key, const std::string& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    if (!value.IsScalar()) {
        throw domain::ContentError(std::string("repository index field '") + key + "' is not a scalar");
    }
    return value.as<std::string>();
}

} // namespace

domain::ChartIndex ChartIndexLoader::Parse(const std::string& bytes) {
    YAML::Node root;
    try {
        root = YAML::Load(bytes);
    } catch (const YAML::Exception& e) {
        throw domain::ContentError(std::string("failed to parse repository index: ") + e.what());
    }

    if (!root.IsMap()) {
        throw domain::ContentError("repository index is not a map");
    }

    domain::ChartIndex index;
    try {
        index.apiVersion = ScalarOr(root, "apiVersion", "");
        if (index.apiVersion.empty()) {
            throw domain::ContentError("no API version specified in repository index");
        }
        index.generated = ScalarOr(root, "generated", "");

        const YAML::Node entries = root["entries"];
        if (!entries || entries.IsNull()) {
            return index;
        }
        if (!entries.IsMap()) {
            throw domain::ContentError("repository index 'entries' is not a map");
        }

        for (const auto& entry : entries) {
            std::string chart = entry.first.as<std::string>();
            if (!entry.second.IsSequence()) {
                throw domain::ContentError("entries for chart '" + chart + "' are not a list");
            }
            for (const auto& item : entry.second) {
                if (!item.IsMap()) {
                    throw domain::ContentError("entry for chart '" + chart + "' is not a map");
                }
                domain::ChartVersion cv;
                cv.name = ScalarOr(item, "name", chart);
                cv.version = ScalarOr(item, "version", "");
                cv.digest = ScalarOr(item, "digest", "");
                cv.created = ScalarOr(item, "created", "");
                const YAML::Node urls = item["urls"];
                if (urls && urls.IsSequence()) {
                    for (const auto& url : urls) {
                        cv.urls.push_back(url.as<std::string>());
                    }
                }
                if (cv.version.empty()) {
                    // Versionless entries are skipped, the rest of the index stays usable.
                    continue;
                }
                index.add(cv);
            }
        }
    } catch (const YAML::Exception& e) {
        throw domain::ContentError(std::string("invalid repository index entry: ") + e.what());
    }

    return index;
}

} // namespace chartkeeper::infrastructure
