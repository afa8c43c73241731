/**
 * @file FileResourceStore.hpp
 * @brief Filesystem-based implementation of the ResourceStore.
 */

#pragma once
#include <string>
#include <mutex>
#include "domain/ResourceStore.hpp"

namespace chartkeeper::infrastructure {

/**
 * @class FileResourceStore
 * @brief Keeps one JSON document per resource under "<stateDir>/<kind>/<namespace>/<name>.json".
 *
 * Documents are replaced with a temp-file rename, so a crash never leaves a
 * half-written resource behind.
 */
class FileResourceStore : public domain::ResourceStore {
public:
    explicit FileResourceStore(std::string stateDir);

    /** @see domain::ResourceStore::get */
    std::optional<domain::ManagedResource> get(domain::ResourceKind kind, const domain::ResourceKey& key) override;

    /** @see domain::ResourceStore::updateStatus */
    bool updateStatus(domain::ResourceKind kind, const domain::ResourceKey& key,
                      const domain::ResourceStatus& status) override;

    /** @see domain::ResourceStore::list */
    std::vector<domain::ResourceKey> list(domain::ResourceKind kind) override;

    /** @brief Creates or replaces a whole resource document (client side). */
    void save(const domain::ManagedResource& resource);

    /** @see domain::ResourceStore::remove */
    bool remove(domain::ResourceKind kind, const domain::ResourceKey& key) override;

private:
    std::string documentPath(domain::ResourceKind kind, const domain::ResourceKey& key) const;
    void writeDocument(const std::string& path, const std::string& content);

    std::string m_stateDir;
    std::mutex m_mutex;
};

} // namespace chartkeeper::infrastructure
