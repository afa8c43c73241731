/**
 * @file ResourceJson.cpp
 * @brief Implementation of the resource JSON mapping.
 */

#include "infrastructure/ResourceJson.hpp"
#include <stdexcept>

namespace chartkeeper::domain {

using json = nlohmann::json;

namespace {

long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

void to_json(json& j, const Artifact& artifact) {
    j = json{
        {"path", artifact.path},
        {"revision", artifact.revision},
        {"checksum", artifact.checksum},
        {"url", artifact.url},
        {"lastUpdateTime", ToMillis(artifact.lastUpdateTime)}
    };
}

void from_json(const json& j, Artifact& artifact) {
    artifact.path = j.value("path", "");
    artifact.revision = j.value("revision", "");
    artifact.checksum = j.value("checksum", "");
    artifact.url = j.value("url", "");
    artifact.lastUpdateTime = FromMillis(j.value("lastUpdateTime", 0LL));
}

void to_json(json& j, const Condition& condition) {
    j = json{
        {"type", condition.type},
        {"status", ConditionStatusToString(condition.status)},
        {"reason", condition.reason},
        {"message", condition.message},
        {"lastTransitionTime", ToMillis(condition.lastTransitionTime)}
    };
}

void from_json(const json& j, Condition& condition) {
    condition.type = j.at("type").get<std::string>();
    condition.status = ConditionStatusFromString(j.value("status", "Unknown"));
    condition.reason = j.value("reason", "");
    condition.message = j.value("message", "");
    condition.lastTransitionTime = FromMillis(j.value("lastTransitionTime", 0LL));
}

void to_json(json& j, const ResourceStatus& status) {
    j = json::object();
    if (status.artifact) {
        j["artifact"] = *status.artifact;
    }
    if (!status.url.empty()) {
        j["url"] = status.url;
    }
    j["observedGeneration"] = status.observedGeneration;
    j["conditions"] = status.conditions.items();
}

void from_json(const json& j, ResourceStatus& status) {
    status = ResourceStatus{};
    if (j.contains("artifact") && j["artifact"].is_object()) {
        status.artifact = j["artifact"].get<Artifact>();
    }
    status.url = j.value("url", "");
    status.observedGeneration = j.value("observedGeneration", 0LL);
    if (j.contains("conditions") && j["conditions"].is_array()) {
        for (const auto& c : j["conditions"]) {
            // Stored transition times are kept verbatim.
            status.conditions.set(c.get<Condition>());
        }
    }
}

void to_json(json& j, const SourceSpec& spec) {
    j = json::object();
    if (spec.interval.count() > 0) j["interval"] = spec.interval.count();
    if (!spec.url.empty()) j["url"] = spec.url;
    if (spec.secretRef) j["secretRef"] = *spec.secretRef;
    if (spec.timeout) j["timeout"] = spec.timeout->count();
    if (!spec.chart.empty()) j["chart"] = spec.chart;
    if (!spec.version.empty()) j["version"] = spec.version;
    if (!spec.sourceRef.empty()) j["sourceRef"] = spec.sourceRef;
}

void from_json(const json& j, SourceSpec& spec) {
    spec = SourceSpec{};
    spec.url = j.value("url", "");
    spec.interval = std::chrono::seconds(j.value("interval", 0LL));
    if (j.contains("secretRef") && j["secretRef"].is_string()) {
        spec.secretRef = j["secretRef"].get<std::string>();
    }
    if (j.contains("timeout") && j["timeout"].is_number_integer()) {
        spec.timeout = std::chrono::seconds(j["timeout"].get<long long>());
    }
    spec.chart = j.value("chart", "");
    spec.version = j.value("version", "");
    spec.sourceRef = j.value("sourceRef", "");
}

void to_json(json& j, const ManagedResource& resource) {
    j = json{
        {"kind", KindToString(resource.kind)},
        {"metadata", {
            {"namespace", resource.key.ns},
            {"name", resource.key.name},
            {"generation", resource.generation}
        }},
        {"spec", resource.spec},
        {"status", resource.status}
    };
}

void from_json(const json& j, ManagedResource& resource) {
    auto kind = KindFromString(j.at("kind").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("unknown resource kind '" + j.at("kind").get<std::string>() + "'");
    }
    resource.kind = *kind;
    const auto& meta = j.at("metadata");
    resource.key.ns = meta.value("namespace", "default");
    resource.key.name = meta.at("name").get<std::string>();
    resource.generation = meta.value("generation", 1LL);
    resource.spec = j.value("spec", json::object()).get<SourceSpec>();
    resource.status = j.value("status", json::object()).get<ResourceStatus>();
}

} // namespace chartkeeper::domain
