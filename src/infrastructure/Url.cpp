#include "infrastructure/Url.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace chartkeeper::infrastructure {

namespace {

bool IsValidScheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

} // namespace

std::string Url::origin() const {
    std::string out = scheme + "://" + host;
    if (port != 0) out += ":" + std::to_string(port);
    return out;
}

Url Url::Parse(const std::string& raw) {
    using Kind = domain::TransportError::Kind;

    size_t sep = raw.find("://");
    if (sep == std::string::npos) {
        throw domain::TransportError(Kind::InvalidURL, "invalid URL '" + raw + "': missing scheme");
    }

    Url url;
    url.scheme = raw.substr(0, sep);
    if (!IsValidScheme(url.scheme)) {
        throw domain::TransportError(Kind::InvalidURL, "invalid URL '" + raw + "': malformed scheme");
    }
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    std::string rest = raw.substr(sep + 3);
    size_t slash = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, slash);
    url.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    if (url.target[0] != '/') url.target.insert(0, "/");
    size_t hash = url.target.find('#');
    if (hash != std::string::npos) url.target.erase(hash);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (!portStr.empty()) {
            if (portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(),
                                                   [](unsigned char c) { return std::isdigit(c); })) {
                throw domain::TransportError(Kind::InvalidURL, "invalid URL '" + raw + "': invalid port");
            }
            url.port = std::stoi(portStr);
            if (url.port == 0 || url.port > 65535) {
                throw domain::TransportError(Kind::InvalidURL, "invalid URL '" + raw + "': invalid port");
            }
        }
    }

    url.host = authority;
    if (url.host.empty()) {
        throw domain::TransportError(Kind::InvalidURL, "invalid URL '" + raw + "': missing host");
    }
    return url;
}

std::string Url::ResolveReference(const std::string& base, const std::string& ref) {
    if (ref.find("://") != std::string::npos) {
        return ref;
    }
    if (!ref.empty() && ref[0] == '/') {
        return Parse(base).origin() + ref;
    }
    std::string r = ref;
    while (r.rfind("./", 0) == 0) r.erase(0, 2);
    return Join(base, r);
}

std::string Url::Join(const std::string& base, const std::string& segment) {
    std::string b = base;
    while (!b.empty() && b.back() == '/') b.pop_back();
    size_t start = segment.find_first_not_of('/');
    return b + "/" + (start == std::string::npos ? std::string() : segment.substr(start));
}

} // namespace chartkeeper::infrastructure
