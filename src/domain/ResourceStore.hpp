/**
 * @file ResourceStore.hpp
 * @brief Interface to the persistence of desired and observed resource state.
 */

#pragma once
#include <optional>
#include <vector>
#include "domain/ManagedResource.hpp"

namespace chartkeeper::domain {

/**
 * @class ResourceStore
 * @brief Reads spec and replaces status of managed resources.
 *
 * Status updates are full replaces, last writer wins. Reconcilers never
 * create or delete resources; only the host removes charts whose
 * repository is gone.
 */
class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    /** @brief Fetches a resource. nullopt when it does not exist. */
    virtual std::optional<ManagedResource> get(ResourceKind kind, const ResourceKey& key) = 0;

    /** @brief Replaces the observed status. Returns false if the resource is gone. */
    virtual bool updateStatus(ResourceKind kind, const ResourceKey& key, const ResourceStatus& status) = 0;

    /** @brief Keys of all stored resources of a kind. */
    virtual std::vector<ResourceKey> list(ResourceKind kind) = 0;

    /**
     * @brief Deletes a resource. Returns false if it did not exist.
     * @throws StorageIOError
     */
    virtual bool remove(ResourceKind kind, const ResourceKey& key) = 0;
};

} // namespace chartkeeper::domain
