#include "infrastructure/HttpSourceFetcher.hpp"
#include "infrastructure/Url.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace chartkeeper::infrastructure {

namespace fs = std::filesystem;

namespace {

/// Private directory holding PEM material for the duration of one request.
class TlsMaterialDir {
public:
    TlsMaterialDir() {
        std::string tmpl = (fs::temp_directory_path() / "chartkeeper-tls-XXXXXX").string();
        if (::mkdtemp(tmpl.data()) == nullptr) {
            throw domain::TransportError(domain::TransportError::Kind::TLSError,
                                         "unable to create directory for TLS material");
        }
        m_dir = tmpl;
    }
    ~TlsMaterialDir() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
        if (ec) {
            std::cerr << "[HttpSourceFetcher] Failed to remove " << m_dir << ": " << ec.message() << std::endl;
        }
    }
    TlsMaterialDir(const TlsMaterialDir&) = delete;
    TlsMaterialDir& operator=(const TlsMaterialDir&) = delete;

    std::string write(const std::string& name, const std::string& pem) {
        fs::path p = m_dir / name;
        std::ofstream out(p, std::ios::binary);
        out << pem;
        out.close();
        if (out.fail()) {
            throw domain::TransportError(domain::TransportError::Kind::TLSError,
                                         "unable to write TLS material '" + name + "'");
        }
        fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write);
        return p.string();
    }

private:
    fs::path m_dir;
};

bool IsTlsError(httplib::Error err) {
    return err == httplib::Error::SSLConnection ||
           err == httplib::Error::SSLLoadingCerts ||
           err == httplib::Error::SSLServerVerification;
}

} // namespace

HttpSourceFetcher::HttpSourceFetcher(std::string userAgent)
    : m_userAgent(std::move(userAgent)) {}

bool HttpSourceFetcher::SupportsScheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

std::string HttpSourceFetcher::fetch(const std::string& url,
                                     const domain::FetchOptions& options,
                                     std::chrono::seconds timeout) {
    using Kind = domain::TransportError::Kind;

    Url u = Url::Parse(url);
    if (!SupportsScheme(u.scheme)) {
        throw domain::TransportError(Kind::UnsupportedScheme, "scheme \"" + u.scheme + "\" not supported");
    }

    std::unique_ptr<TlsMaterialDir> material;
    std::string certPath, keyPath, caPath;
    if (u.scheme == "https" && (options.hasClientCert() || options.hasCA())) {
        material = std::make_unique<TlsMaterialDir>();
        if (options.hasClientCert()) {
            certPath = material->write("cert.pem", options.certPem);
            keyPath = material->write("key.pem", options.keyPem);
        }
        if (options.hasCA()) {
            caPath = material->write("ca.pem", options.caPem);
        }
    }

    httplib::Client cli(u.origin(), certPath, keyPath);
    if (!cli.is_valid()) {
        throw domain::TransportError(Kind::TLSError, "can't create TLS config for client: " + u.origin());
    }
    if (!caPath.empty()) {
        cli.set_ca_cert_path(caPath);
    }
    cli.enable_server_certificate_verification(true);
    cli.set_connection_timeout(static_cast<time_t>(timeout.count()), 0);
    cli.set_read_timeout(static_cast<time_t>(timeout.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(timeout.count()), 0);
    cli.set_follow_location(true);
    if (options.hasBasicAuth()) {
        cli.set_basic_auth(options.username, options.password);
    }

    httplib::Headers headers = {{"User-Agent", m_userAgent}};

    // Read timeouts bound each read only; the deadline bounds the whole transfer.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timedOut = false;
    std::string body;
    auto res = cli.Get(u.target, headers, [&](const char* data, size_t length) {
        if (std::chrono::steady_clock::now() > deadline) {
            timedOut = true;
            return false;
        }
        body.append(data, length);
        return true;
    });
    if (timedOut) {
        throw domain::TransportError(Kind::NetworkError,
            "failed to fetch " + url + ": timeout after " + std::to_string(timeout.count()) + "s");
    }
    if (!res) {
        auto err = res.error();
        std::string message = "failed to fetch " + url + ": " + httplib::to_string(err);
        if (IsTlsError(err)) {
            throw domain::TransportError(Kind::TLSError, message);
        }
        throw domain::TransportError(Kind::NetworkError, message);
    }

    if (res->status < 200 || res->status >= 300) {
        throw domain::TransportError(Kind::NetworkError,
            "failed to fetch " + url + " : " + std::to_string(res->status) + " " + res->reason);
    }
    return body;
}

} // namespace chartkeeper::infrastructure
