/**
 * @file SourceFetcher.hpp
 * @brief Interfaces for resolving credentials and retrieving remote source bytes.
 */

#pragma once
#include <string>
#include <chrono>

namespace chartkeeper::domain {

/**
 * @struct FetchOptions
 * @brief Connection options resolved from a secret reference.
 *
 * TLS material is held as PEM text; the transport decides how to load it.
 */
struct FetchOptions {
    std::string username;
    std::string password;
    std::string certPem; ///< Client certificate.
    std::string keyPem;  ///< Client private key.
    std::string caPem;   ///< Additional trust anchors.

    bool hasBasicAuth() const { return !username.empty() || !password.empty(); }
    bool hasClientCert() const { return !certPem.empty() && !keyPem.empty(); }
    bool hasCA() const { return !caPem.empty(); }
};

/**
 * @class CredentialResolver
 * @brief Turns an opaque secret reference into fetch options.
 */
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;

    /**
     * @brief Resolves the named secret in the given namespace.
     * @throws CredentialError NotFound if the secret does not exist, Malformed
     *         if its contents cannot produce valid options.
     */
    virtual FetchOptions resolve(const std::string& ns, const std::string& secretName) = 0;
};

/**
 * @class SourceFetcher
 * @brief Retrieves remote bytes for a URL.
 */
class SourceFetcher {
public:
    virtual ~SourceFetcher() = default;

    /**
     * @brief Downloads the resource at url.
     * @param url Absolute URL.
     * @param options Credentials and TLS material.
     * @param timeout Upper bound for connecting and for each read.
     * @return The response body.
     * @throws TransportError classified by cause.
     */
    virtual std::string fetch(const std::string& url,
                              const FetchOptions& options,
                              std::chrono::seconds timeout) = 0;
};

} // namespace chartkeeper::domain
