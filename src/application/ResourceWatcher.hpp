/**
 * @file ResourceWatcher.hpp
 * @brief Detects stored resource changes and turns them into queue items.
 */

#pragma once
#include <map>
#include <memory>
#include <vector>
#include "application/ReconcileQueue.hpp"
#include "domain/ResourceStore.hpp"

namespace chartkeeper::application {

/**
 * @class ResourceWatcher
 * @brief Polls the resource store and schedules the passes its changes need.
 *
 * A HelmRepository owns the HelmCharts of its namespace that reference it:
 * when the repository disappears, those charts are removed from the store
 * and queued so their artifacts are collected too.
 *
 * resync() is meant for a single thread; enqueueDependents() may be called
 * from reconcile workers.
 */
class ResourceWatcher {
public:
    ResourceWatcher(std::shared_ptr<domain::ResourceStore> store, ReconcileQueue& queue);

    /**
     * @brief Queues every resource that is new, changed generation or vanished.
     * @return Number of items queued.
     */
    size_t resync();

    /** @brief Queues the charts built from a repository, e.g. after its index changed. */
    void enqueueDependents(const domain::ResourceKey& repository);

    /** @brief Keys of the HelmCharts referencing a repository. */
    std::vector<domain::ResourceKey> dependents(const domain::ResourceKey& repository);

private:
    size_t removeOwnedCharts(const domain::ResourceKey& repository);

    std::shared_ptr<domain::ResourceStore> m_store;
    ReconcileQueue& m_queue;
    std::map<QueueItem, long long> m_known;
};

} // namespace chartkeeper::application
