/**
 * @file ReconcileQueue.hpp
 * @brief Delayed, de-duplicated work queue feeding a bounded pool of reconcile workers.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include "application/ReconcileResult.hpp"
#include "domain/ManagedResource.hpp"

namespace chartkeeper::application {

/**
 * @struct QueueItem
 * @brief Identity of one unit of work: a resource of a given kind.
 */
struct QueueItem {
    domain::ResourceKind kind = domain::ResourceKind::HelmRepository;
    domain::ResourceKey key;

    std::string toString() const { return domain::KindToString(kind) + "/" + key.toString(); }

    bool operator<(const QueueItem& other) const {
        if (kind != other.kind) return kind < other.kind;
        return key < other.key;
    }
    bool operator==(const QueueItem& other) const { return kind == other.kind && key == other.key; }
};

/**
 * @class ReconcileQueue
 * @brief Runs reconcile passes on worker threads, honoring the delays they return.
 *
 * An item is pending at most once; adding it again only moves its due time
 * earlier. An item is never handed to two workers at the same time, so
 * passes for one resource are serialized while different resources run
 * concurrently.
 */
class ReconcileQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Handler = std::function<ReconcileOutcome(const QueueItem&)>;

    /**
     * @param handler Runs one pass for an item.
     * @param workers Number of worker threads.
     * @param errorBackoff Delay before retrying a failed pass that asked for none.
     */
    ReconcileQueue(Handler handler, int workers, std::chrono::milliseconds errorBackoff);
    ~ReconcileQueue();

    ReconcileQueue(const ReconcileQueue&) = delete;
    ReconcileQueue& operator=(const ReconcileQueue&) = delete;

    /** @brief Schedules an item now. */
    void add(const QueueItem& item);

    /** @brief Schedules an item after a delay, unless it is already due earlier. */
    void addAfter(const QueueItem& item, std::chrono::milliseconds delay);

    /** @brief Starts the worker threads. */
    void start();

    /** @brief Stops the workers after their current pass. Pending items are dropped. */
    void stop();

    /** @brief Number of items waiting (due or not). */
    size_t pendingCount() const;

    /** @brief Number of items currently being reconciled. */
    size_t activeCount() const;

    /** @brief True if the item is waiting to run. */
    bool isPending(const QueueItem& item) const;

private:
    void workerLoop();
    void schedule(const QueueItem& item, Clock::time_point due);
    void finish(const QueueItem& item, const ReconcileOutcome& outcome);

    Handler m_handler;
    int m_workerCount;
    std::chrono::milliseconds m_errorBackoff;

    std::map<QueueItem, Clock::time_point> m_pending;
    std::set<QueueItem> m_processing;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::vector<std::thread> m_workers;
    bool m_running = false;
};

} // namespace chartkeeper::application
