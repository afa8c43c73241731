/**
 * @file Conditions.hpp
 * @brief Ordered condition set published in a resource's status.
 */

#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace chartkeeper::domain {

/// Condition types.
inline constexpr const char* kReadyCondition = "Ready";
inline constexpr const char* kArtifactOutdatedCondition = "ArtifactOutdated";
inline constexpr const char* kArtifactUnavailableCondition = "ArtifactUnavailable";
inline constexpr const char* kFetchFailedCondition = "FetchFailed";

/// Condition reasons.
inline constexpr const char* kSucceededReason = "Succeeded";
inline constexpr const char* kFailedReason = "Failed";
inline constexpr const char* kNoArtifactReason = "NoArtifact";
inline constexpr const char* kNewRevisionReason = "NewRevision";
inline constexpr const char* kAuthenticationFailedReason = "AuthenticationFailed";
inline constexpr const char* kURLInvalidReason = "URLInvalid";
inline constexpr const char* kStorageOperationFailedReason = "StorageOperationFailed";
inline constexpr const char* kChartPullFailedReason = "ChartPullFailed";
inline constexpr const char* kIndexationFailedReason = "IndexationFailed";
inline constexpr const char* kSourceUnavailableReason = "SourceUnavailable";

/**
 * @enum ConditionStatus
 * @brief Tri-state value of a condition.
 */
enum class ConditionStatus {
    True,
    False,
    Unknown
};

inline std::string ConditionStatusToString(ConditionStatus status) {
    switch (status) {
        case ConditionStatus::True: return "True";
        case ConditionStatus::False: return "False";
        default: return "Unknown";
    }
}

inline ConditionStatus ConditionStatusFromString(const std::string& value) {
    if (value == "True") return ConditionStatus::True;
    if (value == "False") return ConditionStatus::False;
    return ConditionStatus::Unknown;
}

/**
 * @struct Condition
 * @brief A named status flag with a machine-readable reason and a human message.
 */
struct Condition {
    std::string type;
    ConditionStatus status = ConditionStatus::Unknown;
    std::string reason;
    std::string message;
    std::chrono::system_clock::time_point lastTransitionTime{};

    bool operator==(const Condition& other) const {
        return type == other.type && status == other.status && reason == other.reason &&
               message == other.message && lastTransitionTime == other.lastTransitionTime;
    }
    bool operator!=(const Condition& other) const { return !(*this == other); }
};

/**
 * @class ConditionSet
 * @brief Ordered collection of conditions with upsert-by-type semantics.
 *
 * Setting an existing type replaces it in place; a new type is appended.
 * The transition time only moves when the status actually changes.
 */
class ConditionSet {
public:
    /** @brief Inserts or replaces the condition of the same type. */
    void set(Condition condition);

    /** @brief Removes the condition of the given type. Returns false if absent. */
    bool remove(const std::string& type);

    /** @brief Returns the condition of the given type, if present. */
    std::optional<Condition> get(const std::string& type) const;

    bool has(const std::string& type) const;
    bool isTrue(const std::string& type) const;
    bool isFalse(const std::string& type) const;

    void markTrue(const std::string& type, const std::string& reason, const std::string& message);
    void markFalse(const std::string& type, const std::string& reason, const std::string& message);
    void markUnknown(const std::string& type, const std::string& reason, const std::string& message);

    const std::vector<Condition>& items() const { return m_items; }
    bool empty() const { return m_items.empty(); }
    size_t size() const { return m_items.size(); }
    void clear() { m_items.clear(); }

    bool operator==(const ConditionSet& other) const { return m_items == other.m_items; }
    bool operator!=(const ConditionSet& other) const { return !(*this == other); }

private:
    std::vector<Condition> m_items;
};

} // namespace chartkeeper::domain
