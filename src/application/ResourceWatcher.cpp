/**
 * @file ResourceWatcher.cpp
 * @brief Implementation of ResourceWatcher.
 */

#include "application/ResourceWatcher.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <set>

namespace chartkeeper::application {

using domain::ResourceKind;

ResourceWatcher::ResourceWatcher(std::shared_ptr<domain::ResourceStore> store, ReconcileQueue& queue)
    : m_store(std::move(store)), m_queue(queue) {}

size_t ResourceWatcher::resync() {
    size_t queued = 0;
    std::set<QueueItem> seen;
    for (auto kind : {ResourceKind::HelmRepository, ResourceKind::HelmChart}) {
        for (const auto& key : m_store->list(kind)) {
            QueueItem item{kind, key};
            auto resource = m_store->get(kind, key);
            if (!resource) continue;
            seen.insert(item);

            auto it = m_known.find(item);
            if (it == m_known.end() || it->second != resource->generation) {
                m_known[item] = resource->generation;
                m_queue.add(item);
                ++queued;
            }
        }
    }

    std::vector<QueueItem> vanished;
    for (auto it = m_known.begin(); it != m_known.end();) {
        if (!seen.count(it->first)) {
            vanished.push_back(it->first);
            it = m_known.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& item : vanished) {
        std::cout << "[ResourceWatcher] " << item.toString() << " was deleted" << std::endl;
        m_queue.add(item);
        ++queued;
        if (item.kind == ResourceKind::HelmRepository) {
            queued += removeOwnedCharts(item.key);
        }
    }
    return queued;
}

size_t ResourceWatcher::removeOwnedCharts(const domain::ResourceKey& repository) {
    size_t queued = 0;
    for (const auto& chartKey : dependents(repository)) {
        QueueItem chart{ResourceKind::HelmChart, chartKey};
        try {
            m_store->remove(ResourceKind::HelmChart, chartKey);
        } catch (const domain::StorageIOError& e) {
            std::cerr << "[ResourceWatcher] Failed to remove " << chart.toString() << " owned by deleted "
                      << "HelmRepository/" << repository.toString() << ": " << e.what() << std::endl;
            continue;
        }
        std::cout << "[ResourceWatcher] Removed " << chart.toString() << " owned by deleted HelmRepository/"
                  << repository.toString() << std::endl;
        m_known.erase(chart);
        m_queue.add(chart);
        ++queued;
    }
    return queued;
}

std::vector<domain::ResourceKey> ResourceWatcher::dependents(const domain::ResourceKey& repository) {
    std::vector<domain::ResourceKey> charts;
    for (const auto& chartKey : m_store->list(ResourceKind::HelmChart)) {
        if (chartKey.ns != repository.ns) continue;
        auto chart = m_store->get(ResourceKind::HelmChart, chartKey);
        if (chart && chart->spec.sourceRef == repository.name) {
            charts.push_back(chartKey);
        }
    }
    return charts;
}

void ResourceWatcher::enqueueDependents(const domain::ResourceKey& repository) {
    for (const auto& chartKey : dependents(repository)) {
        m_queue.add({ResourceKind::HelmChart, chartKey});
    }
}

} // namespace chartkeeper::application
