/**
 * @file ReconcileQueue.cpp
 * @brief Implementation of ReconcileQueue.
 */

#include "application/ReconcileQueue.hpp"
#include <iostream>

namespace chartkeeper::application {

ReconcileQueue::ReconcileQueue(Handler handler, int workers, std::chrono::milliseconds errorBackoff)
    : m_handler(std::move(handler)), m_workerCount(workers < 1 ? 1 : workers), m_errorBackoff(errorBackoff) {}

ReconcileQueue::~ReconcileQueue() {
    stop();
}

void ReconcileQueue::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    for (int i = 0; i < m_workerCount; ++i) {
        m_workers.emplace_back(&ReconcileQueue::workerLoop, this);
    }
}

void ReconcileQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.clear();
}

void ReconcileQueue::add(const QueueItem& item) {
    addAfter(item, std::chrono::milliseconds(0));
}

void ReconcileQueue::addAfter(const QueueItem& item, std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        schedule(item, Clock::now() + delay);
    }
    m_cv.notify_all();
}

void ReconcileQueue::schedule(const QueueItem& item, Clock::time_point due) {
    auto it = m_pending.find(item);
    if (it == m_pending.end()) {
        m_pending.emplace(item, due);
    } else if (due < it->second) {
        it->second = due;
    }
}

size_t ReconcileQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

size_t ReconcileQueue::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_processing.size();
}

bool ReconcileQueue::isPending(const QueueItem& item) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.count(item) > 0;
}

void ReconcileQueue::workerLoop() {
    while (true) {
        QueueItem item;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (true) {
                if (!m_running) {
                    return; // Exit point
                }

                // Earliest pending item that no other worker holds.
                auto next = m_pending.end();
                for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
                    if (m_processing.count(it->first)) continue;
                    if (next == m_pending.end() || it->second < next->second) next = it;
                }

                if (next == m_pending.end()) {
                    m_cv.wait(lock);
                    continue;
                }
                if (next->second > Clock::now()) {
                    m_cv.wait_until(lock, next->second);
                    continue;
                }

                item = next->first;
                m_pending.erase(next);
                m_processing.insert(item);
                break;
            }
        }

        // Process outside lock
        ReconcileOutcome outcome;
        try {
            outcome = m_handler(item);
        } catch (const std::exception& e) {
            std::cerr << "[ReconcileQueue] " << item.toString() << ": " << e.what() << std::endl;
            outcome.error = std::string(e.what());
        }
        finish(item, outcome);
    }
}

void ReconcileQueue::finish(const QueueItem& item, const ReconcileOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_processing.erase(item);

        if (outcome.result.requeue) {
            schedule(item, Clock::now());
        } else if (outcome.result.requeueAfter.count() > 0) {
            schedule(item, Clock::now() + outcome.result.requeueAfter);
        } else if (outcome.failed()) {
            schedule(item, Clock::now() + m_errorBackoff);
        }
    }
    m_cv.notify_all();
}

} // namespace chartkeeper::application
