/**
 * @file FileSecretStore.hpp
 * @brief Credential resolver backed by JSON secret documents on disk.
 */

#pragma once
#include <string>
#include "domain/SourceFetcher.hpp"

namespace chartkeeper::infrastructure {

/**
 * @class FileSecretStore
 * @brief Resolves "<secretsDir>/<namespace>/<name>.json" into fetch options.
 *
 * Recognized keys: "username", "password", "certFile", "keyFile", "caFile"
 * (the last three hold PEM text).
 */
class FileSecretStore : public domain::CredentialResolver {
public:
    explicit FileSecretStore(std::string secretsDir);

    /** @see domain::CredentialResolver::resolve */
    domain::FetchOptions resolve(const std::string& ns, const std::string& secretName) override;

    /**
     * @brief Validates secret data and converts it into options.
     * @throws domain::CredentialError Malformed on incomplete pairs or unusable CA material.
     */
    static domain::FetchOptions OptionsFromSecretData(const std::string& secretName,
                                                      const std::string& username,
                                                      const std::string& password,
                                                      const std::string& certPem,
                                                      const std::string& keyPem,
                                                      const std::string& caPem);

private:
    std::string m_secretsDir;
};

} // namespace chartkeeper::infrastructure
