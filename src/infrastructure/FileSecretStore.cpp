/**
 * @file FileSecretStore.cpp
 * @brief Implementation of FileSecretStore.
 */

#include "infrastructure/FileSecretStore.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace chartkeeper::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/// Number of certificates OpenSSL can read from a PEM bundle.
int CountCertificates(const std::string& pem) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) return 0;

    int count = 0;
    while (true) {
        X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
        if (!cert) break;
        X509_free(cert);
        ++count;
    }
    ERR_clear_error();
    return count;
}

bool IsValidPrivateKey(const std::string& pem) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
    if (!bio) return false;
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    ERR_clear_error();
    if (!key) return false;
    EVP_PKEY_free(key);
    return true;
}

std::string StringField(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    if (!j[key].is_string()) {
        throw domain::CredentialError(domain::CredentialError::Kind::Malformed,
                                      std::string("field '") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

} // namespace

FileSecretStore::FileSecretStore(std::string secretsDir)
    : m_secretsDir(std::move(secretsDir)) {}

domain::FetchOptions FileSecretStore::resolve(const std::string& ns, const std::string& secretName) {
    fs::path p = fs::path(m_secretsDir) / ns / (secretName + ".json");
    std::error_code ec;
    if (secretName.empty() || secretName.find('/') != std::string::npos || !fs::is_regular_file(p, ec)) {
        throw domain::CredentialError(domain::CredentialError::Kind::NotFound,
                                      "secrets \"" + secretName + "\" not found");
    }

    json j;
    try {
        std::ifstream f(p);
        f >> j;
    } catch (const json::exception& e) {
        throw domain::CredentialError(domain::CredentialError::Kind::Malformed,
                                      "secret '" + secretName + "' is not valid JSON: " + e.what());
    }
    if (!j.is_object()) {
        throw domain::CredentialError(domain::CredentialError::Kind::Malformed,
                                      "secret '" + secretName + "' is not an object");
    }

    return OptionsFromSecretData(secretName,
                                 StringField(j, "username"),
                                 StringField(j, "password"),
                                 StringField(j, "certFile"),
                                 StringField(j, "keyFile"),
                                 StringField(j, "caFile"));
}

domain::FetchOptions FileSecretStore::OptionsFromSecretData(const std::string& secretName,
                                                            const std::string& username,
                                                            const std::string& password,
                                                            const std::string& certPem,
                                                            const std::string& keyPem,
                                                            const std::string& caPem) {
    using Kind = domain::CredentialError::Kind;

    if (username.empty() != password.empty()) {
        throw domain::CredentialError(Kind::Malformed,
            "invalid '" + secretName + "' secret data: required fields 'username' and 'password'");
    }
    if (certPem.empty() != keyPem.empty()) {
        throw domain::CredentialError(Kind::Malformed,
            "invalid '" + secretName + "' secret data: required fields 'certFile' and 'keyFile'");
    }
    if (!certPem.empty()) {
        if (CountCertificates(certPem) == 0) {
            throw domain::CredentialError(Kind::Malformed,
                "can't create TLS config for client: failed to parse certificate in '" + secretName + "'");
        }
        if (!IsValidPrivateKey(keyPem)) {
            throw domain::CredentialError(Kind::Malformed,
                "can't create TLS config for client: failed to parse private key in '" + secretName + "'");
        }
    }
    if (!caPem.empty() && CountCertificates(caPem) == 0) {
        throw domain::CredentialError(Kind::Malformed,
            "can't create TLS config for client: failed to append certificates from file");
    }

    domain::FetchOptions options;
    options.username = username;
    options.password = password;
    options.certPem = certPem;
    options.keyPem = keyPem;
    options.caPem = caPem;
    return options;
}

} // namespace chartkeeper::infrastructure
