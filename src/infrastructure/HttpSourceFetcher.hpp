/**
 * @file HttpSourceFetcher.hpp
 * @brief HTTP(S) transport for repository indices and chart packages.
 */

#pragma once

#include <string>
#include <chrono>
#include "domain/SourceFetcher.hpp"

namespace chartkeeper::infrastructure {

/**
 * @class HttpSourceFetcher
 * @brief Downloads sources over http and https with optional basic auth and TLS material.
 */
class HttpSourceFetcher : public domain::SourceFetcher {
public:
    /** @param userAgent Value of the User-Agent header. */
    explicit HttpSourceFetcher(std::string userAgent = "chartkeeper");

    /** @see domain::SourceFetcher::fetch */
    std::string fetch(const std::string& url,
                      const domain::FetchOptions& options,
                      std::chrono::seconds timeout) override;

    /** @brief True for the schemes this fetcher can serve. */
    static bool SupportsScheme(const std::string& scheme);

private:
    std::string m_userAgent;
};

} // namespace chartkeeper::infrastructure
