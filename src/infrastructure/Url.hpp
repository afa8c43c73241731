/**
 * @file Url.hpp
 * @brief Minimal absolute URL parsing and reference resolution for source locations.
 */

#pragma once
#include <string>

namespace chartkeeper::infrastructure {

/**
 * @struct Url
 * @brief Split form of "scheme://[user@]host[:port][/target]".
 */
struct Url {
    std::string scheme; ///< Lower-cased.
    std::string host;
    int port = 0;       ///< 0 when not given.
    std::string target; ///< Path plus query, always starts with '/'.

    /** @brief "scheme://host[:port]". */
    std::string origin() const;

    /**
     * @brief Parses an absolute URL.
     * @throws domain::TransportError InvalidURL when it is not absolute or has no host.
     */
    static Url Parse(const std::string& raw);

    /**
     * @brief Resolves ref against base the way chart download URLs are resolved.
     *
     * Absolute refs are returned as-is, "/x" replaces the path of base,
     * anything else is appended to base as a directory.
     */
    static std::string ResolveReference(const std::string& base, const std::string& ref);

    /** @brief base with exactly one '/' then segment. */
    static std::string Join(const std::string& base, const std::string& segment);
};

} // namespace chartkeeper::infrastructure
