/**
 * @file ChartIndex.cpp
 * @brief Implementation of ChartIndex and version ordering.
 */

#include "domain/ChartIndex.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace chartkeeper::domain {

namespace {

std::vector<std::string> Split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        parts.push_back(item);
    }
    return parts;
}

bool IsNumeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

int CompareSegment(const std::string& a, const std::string& b) {
    if (IsNumeric(a) && IsNumeric(b)) {
        // Strip leading zeros and compare by length first to avoid overflow.
        std::string x = a.substr(std::min(a.find_first_not_of('0'), a.size() - 1));
        std::string y = b.substr(std::min(b.find_first_not_of('0'), b.size() - 1));
        if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
        return x.compare(y) < 0 ? -1 : (x == y ? 0 : 1);
    }
    // Numeric identifiers have lower precedence than alphanumeric ones.
    if (IsNumeric(a)) return -1;
    if (IsNumeric(b)) return 1;
    return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}

int CompareDotted(const std::string& lhs, const std::string& rhs) {
    auto a = Split(lhs, '.');
    auto b = Split(rhs, '.');
    size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (i >= a.size()) return -1;
        if (i >= b.size()) return 1;
        int c = CompareSegment(a[i], b[i]);
        if (c != 0) return c;
    }
    return 0;
}

} // namespace

int CompareVersions(const std::string& lhs, const std::string& rhs) {
    auto stripBuild = [](const std::string& v) {
        std::string s = v.substr(0, v.find('+'));
        if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) s.erase(0, 1);
        return s;
    };
    std::string a = stripBuild(lhs);
    std::string b = stripBuild(rhs);

    size_t dashA = a.find('-');
    size_t dashB = b.find('-');
    std::string coreA = a.substr(0, dashA);
    std::string coreB = b.substr(0, dashB);

    int c = CompareDotted(coreA, coreB);
    if (c != 0) return c;

    bool preA = dashA != std::string::npos;
    bool preB = dashB != std::string::npos;
    if (preA != preB) return preA ? -1 : 1;
    if (!preA) return 0;
    return CompareDotted(a.substr(dashA + 1), b.substr(dashB + 1));
}

void ChartIndex::add(const ChartVersion& cv) {
    auto& versions = m_entries[cv.name];
    versions.push_back(cv);
    std::stable_sort(versions.begin(), versions.end(), [](const ChartVersion& x, const ChartVersion& y) {
        return CompareVersions(x.version, y.version) > 0;
    });
}

void ChartIndex::sortEntries() {
    for (auto& [name, versions] : m_entries) {
        std::stable_sort(versions.begin(), versions.end(), [](const ChartVersion& x, const ChartVersion& y) {
            return CompareVersions(x.version, y.version) > 0;
        });
    }
}

const ChartVersion& ChartIndex::get(const std::string& name, const std::string& version) const {
    auto it = m_entries.find(name);
    if (it == m_entries.end() || it->second.empty()) {
        throw ContentError("chart '" + name + "' could not be found in repository index");
    }
    if (version.empty() || version == "*") {
        return it->second.front();
    }
    for (const auto& cv : it->second) {
        if (cv.version == version) return cv;
    }
    throw ContentError("no chart with version '" + version + "' found for '" + name + "'");
}

bool ChartIndex::has(const std::string& name) const {
    auto it = m_entries.find(name);
    return it != m_entries.end() && !it->second.empty();
}

bool ChartIndex::empty() const {
    for (const auto& [name, versions] : m_entries) {
        if (!versions.empty()) return false;
    }
    return true;
}

} // namespace chartkeeper::domain
