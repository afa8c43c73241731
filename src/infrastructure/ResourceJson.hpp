/**
 * @file ResourceJson.hpp
 * @brief JSON mapping of managed resources and their status.
 */

#pragma once
#include <nlohmann/json.hpp>
#include "domain/ManagedResource.hpp"

namespace chartkeeper::domain {

// Found by nlohmann::json through argument-dependent lookup.
void to_json(nlohmann::json& j, const Artifact& artifact);
void from_json(const nlohmann::json& j, Artifact& artifact);
void to_json(nlohmann::json& j, const Condition& condition);
void from_json(const nlohmann::json& j, Condition& condition);
void to_json(nlohmann::json& j, const ResourceStatus& status);
void from_json(const nlohmann::json& j, ResourceStatus& status);
void to_json(nlohmann::json& j, const SourceSpec& spec);
void from_json(const nlohmann::json& j, SourceSpec& spec);
void to_json(nlohmann::json& j, const ManagedResource& resource);
void from_json(const nlohmann::json& j, ManagedResource& resource);

} // namespace chartkeeper::domain
