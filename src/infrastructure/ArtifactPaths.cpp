#include "infrastructure/ArtifactPaths.hpp"

namespace chartkeeper::infrastructure {

std::string ArtifactPaths::ArtifactPath(domain::ResourceKind kind, const domain::ResourceKey& key,
                                        const std::string& filename) {
    return ArtifactDir(kind, key) + "/" + filename;
}

std::string ArtifactPaths::ArtifactDir(domain::ResourceKind kind, const domain::ResourceKey& key) {
    return domain::KindPathSegment(kind) + "/" + key.ns + "/" + key.name;
}

std::string ArtifactPaths::ArtifactURL(const std::string& hostname, const std::string& path) {
    std::string host = hostname;
    while (!host.empty() && host.back() == '/') host.pop_back();

    size_t start = path.find_first_not_of('/');
    std::string rel = (start == std::string::npos) ? std::string() : path.substr(start);
    return host + "/" + rel;
}

std::string ArtifactPaths::LatestLinkName(domain::ResourceKind kind, const std::string& extension) {
    std::string name = domain::KindPathSegment(kind) + "-latest";
    if (!extension.empty()) name += "." + extension;
    return name;
}

std::string ArtifactPaths::Extension(const std::string& filename) {
    size_t slash = filename.find_last_of('/');
    std::string base = (slash == std::string::npos) ? filename : filename.substr(slash + 1);
    size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return {};
    return base.substr(dot + 1);
}

} // namespace chartkeeper::infrastructure
