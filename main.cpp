#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>

#include "application/HelmChartReconciler.hpp"
#include "application/HelmRepositoryReconciler.hpp"
#include "application/ReconcileQueue.hpp"
#include "application/ResourceWatcher.hpp"
#include "infrastructure/ArtifactStorage.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileResourceStore.hpp"
#include "infrastructure/FileSecretStore.hpp"
#include "infrastructure/HttpSourceFetcher.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace chartkeeper;

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void HandleSignal(int) {
    g_stopRequested = 1;
}

std::string RepositoryRevision(domain::ResourceStore& store, const domain::ResourceKey& key) {
    auto repo = store.get(domain::ResourceKind::HelmRepository, key);
    if (!repo || !repo->status.artifact) return {};
    return repo->status.artifact->revision;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : infrastructure::PathUtils::GetDefaultConfigFile().string();
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(configPath);

    std::cout << "[ChartKeeper] Storage root: " << config.storagePath << std::endl;
    std::cout << "[ChartKeeper] Storage hostname: " << config.storageHostname << std::endl;
    std::cout << "[ChartKeeper] Resource state: " << config.stateDir << std::endl;

    std::shared_ptr<infrastructure::ArtifactStorage> storage;
    std::shared_ptr<infrastructure::FileResourceStore> store;
    try {
        storage = std::make_shared<infrastructure::ArtifactStorage>(config.storagePath, config.storageHostname);
        store = std::make_shared<infrastructure::FileResourceStore>(config.stateDir);
    } catch (const std::exception& e) {
        std::cerr << "[ChartKeeper] Failed to initialize storage: " << e.what() << std::endl;
        return 1;
    }
    auto secrets = std::make_shared<infrastructure::FileSecretStore>(config.secretsDir);
    auto fetcher = std::make_shared<infrastructure::HttpSourceFetcher>();

    application::ReconcilerOptions options;
    options.defaultInterval = config.defaultInterval;
    options.defaultTimeout = config.defaultTimeout;
    options.retryInterval = config.retryInterval;

    application::HelmRepositoryReconciler repositories(store, storage, secrets, fetcher, options);
    application::HelmChartReconciler charts(store, storage, secrets, fetcher, options);

    application::ResourceWatcher* watcherPtr = nullptr;
    auto handler = [&](const application::QueueItem& item) -> application::ReconcileOutcome {
        application::SourceReconciler& reconciler =
            item.kind == domain::ResourceKind::HelmRepository
                ? static_cast<application::SourceReconciler&>(repositories)
                : static_cast<application::SourceReconciler&>(charts);

        if (!store->get(item.kind, item.key)) {
            return reconciler.reconcileDelete(item.key);
        }
        if (item.kind != domain::ResourceKind::HelmRepository) {
            return reconciler.reconcile(item.key);
        }

        // Charts follow the index of their repository.
        std::string before = RepositoryRevision(*store, item.key);
        auto outcome = reconciler.reconcile(item.key);
        std::string after = RepositoryRevision(*store, item.key);
        if (!after.empty() && after != before) {
            watcherPtr->enqueueDependents(item.key);
        }
        return outcome;
    };

    application::ReconcileQueue queue(handler, config.concurrency,
                                      std::chrono::duration_cast<std::chrono::milliseconds>(config.retryInterval));
    application::ResourceWatcher watcher(store, queue);
    watcherPtr = &watcher;

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::unique_ptr<httplib::Server> server;
    std::thread serverThread;
    if (config.serveArtifacts) {
        server = std::make_unique<httplib::Server>();
        if (!server->set_mount_point("/", config.storagePath)) {
            std::cerr << "[ChartKeeper] Unable to serve " << config.storagePath << std::endl;
            return 1;
        }
        serverThread = std::thread([&]() {
            std::cout << "[ChartKeeper] Serving artifacts on " << config.listenAddress << ":"
                      << config.listenPort << std::endl;
            if (!server->listen(config.listenAddress, config.listenPort)) {
                std::cerr << "[ChartKeeper] Artifact server failed to listen" << std::endl;
            }
        });
    }

    queue.start();

    auto nextResync = std::chrono::steady_clock::now();
    while (!g_stopRequested) {
        if (std::chrono::steady_clock::now() >= nextResync) {
            try {
                watcher.resync();
            } catch (const std::exception& e) {
                std::cerr << "[ChartKeeper] Resync failed: " << e.what() << std::endl;
            }
            nextResync = std::chrono::steady_clock::now() + config.retryInterval;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[ChartKeeper] Shutting down..." << std::endl;
    queue.stop();
    if (server) {
        server->stop();
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    return 0;
}
