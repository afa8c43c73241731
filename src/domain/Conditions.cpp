/**
 * @file Conditions.cpp
 * @brief Implementation of ConditionSet.
 */

#include "domain/Conditions.hpp"
#include <algorithm>

namespace chartkeeper::domain {

void ConditionSet::set(Condition condition) {
    auto it = std::find_if(m_items.begin(), m_items.end(),
        [&](const Condition& c) { return c.type == condition.type; });

    if (it == m_items.end()) {
        if (condition.lastTransitionTime == std::chrono::system_clock::time_point{}) {
            condition.lastTransitionTime = std::chrono::system_clock::now();
        }
        m_items.push_back(std::move(condition));
        return;
    }

    if (it->status == condition.status) {
        condition.lastTransitionTime = it->lastTransitionTime;
    } else if (condition.lastTransitionTime == std::chrono::system_clock::time_point{}) {
        condition.lastTransitionTime = std::chrono::system_clock::now();
    }
    *it = std::move(condition);
}

bool ConditionSet::remove(const std::string& type) {
    auto it = std::remove_if(m_items.begin(), m_items.end(),
        [&](const Condition& c) { return c.type == type; });
    if (it == m_items.end()) return false;
    m_items.erase(it, m_items.end());
    return true;
}

std::optional<Condition> ConditionSet::get(const std::string& type) const {
    for (const auto& c : m_items) {
        if (c.type == type) return c;
    }
    return std::nullopt;
}

bool ConditionSet::has(const std::string& type) const {
    return get(type).has_value();
}

bool ConditionSet::isTrue(const std::string& type) const {
    auto c = get(type);
    return c && c->status == ConditionStatus::True;
}

bool ConditionSet::isFalse(const std::string& type) const {
    auto c = get(type);
    return c && c->status == ConditionStatus::False;
}

void ConditionSet::markTrue(const std::string& type, const std::string& reason, const std::string& message) {
    set(Condition{type, ConditionStatus::True, reason, message, {}});
}

void ConditionSet::markFalse(const std::string& type, const std::string& reason, const std::string& message) {
    set(Condition{type, ConditionStatus::False, reason, message, {}});
}

void ConditionSet::markUnknown(const std::string& type, const std::string& reason, const std::string& message) {
    set(Condition{type, ConditionStatus::Unknown, reason, message, {}});
}

} // namespace chartkeeper::domain
