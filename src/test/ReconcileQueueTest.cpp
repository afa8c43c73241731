#include <cassert>
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "application/ReconcileQueue.hpp"

using namespace chartkeeper;
using application::QueueItem;
using application::ReconcileOutcome;
using application::ReconcileQueue;

namespace {

QueueItem Item(const std::string& name) {
    return QueueItem{domain::ResourceKind::HelmRepository, {"default", name}};
}

bool WaitFor(const std::function<bool()>& predicate, int timeoutMs = 3000) {
    for (int elapsed = 0; elapsed < timeoutMs; elapsed += 10) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

void TestDeduplication() {
    std::atomic<int> calls{0};
    ReconcileQueue queue([&](const QueueItem&) {
        ++calls;
        return ReconcileOutcome{};
    }, 2, std::chrono::milliseconds(50));

    queue.add(Item("a"));
    queue.add(Item("a"));
    queue.addAfter(Item("a"), std::chrono::milliseconds(500));
    assert(queue.pendingCount() == 1);
    assert(queue.isPending(Item("a")));

    queue.start();
    assert(WaitFor([&] { return calls.load() == 1 && queue.activeCount() == 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(calls.load() == 1);
    assert(queue.pendingCount() == 0);
    queue.stop();
    std::cout << "[PASS] Duplicate adds collapse into one pass." << std::endl;
}

void TestPerKeySerialization() {
    std::mutex mutex;
    std::map<std::string, int> inside;
    std::atomic<bool> overlap{false};
    std::atomic<int> maxParallel{0};
    std::atomic<int> running{0};
    std::atomic<int> calls{0};
    std::atomic<bool> aStarted{false};

    ReconcileQueue queue([&](const QueueItem& item) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (++inside[item.key.name] > 1) overlap = true;
        }
        if (item.key.name == "a") aStarted = true;
        int now = ++running;
        int seen = maxParallel.load();
        while (now > seen && !maxParallel.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        --running;
        {
            std::lock_guard<std::mutex> lock(mutex);
            --inside[item.key.name];
        }
        ++calls;
        return ReconcileOutcome{};
    }, 4, std::chrono::milliseconds(50));

    queue.start();
    queue.add(Item("a"));
    queue.add(Item("b"));
    queue.add(Item("c"));
    // Re-adding a key while it runs schedules exactly one more pass.
    assert(WaitFor([&] { return aStarted.load(); }));
    queue.add(Item("a"));
    queue.add(Item("a"));

    assert(WaitFor([&] { return calls.load() == 4 && queue.pendingCount() == 0 && queue.activeCount() == 0; }));
    queue.stop();
    assert(!overlap);
    assert(maxParallel.load() > 1);
    std::cout << "[PASS] Keys serialized, different keys run in parallel." << std::endl;
}

void TestRequeueDecisions() {
    std::atomic<int> immediate{0};
    std::atomic<int> failing{0};
    std::atomic<int> throwing{0};
    std::atomic<int> quiet{0};

    ReconcileQueue queue([&](const QueueItem& item) {
        ReconcileOutcome outcome;
        if (item.key.name == "immediate") {
            if (++immediate < 3) outcome.result = application::ReconcileResult::Immediately();
        } else if (item.key.name == "failing") {
            if (++failing < 3) outcome.error = std::string("content error");
        } else if (item.key.name == "throwing") {
            if (++throwing < 2) throw std::runtime_error("unexpected");
        } else {
            ++quiet;
        }
        return outcome;
    }, 2, std::chrono::milliseconds(20));

    queue.start();
    queue.add(Item("immediate"));
    queue.add(Item("failing"));
    queue.add(Item("throwing"));
    queue.add(Item("quiet"));

    assert(WaitFor([&] { return immediate.load() == 3 && failing.load() == 3 && throwing.load() == 2; }));
    assert(WaitFor([&] { return queue.pendingCount() == 0 && queue.activeCount() == 0; }));
    assert(quiet.load() == 1);
    queue.stop();
    std::cout << "[PASS] Immediate, error and exception requeues; zero results rest." << std::endl;
}

void TestDelayedItem() {
    std::atomic<int> calls{0};
    ReconcileQueue queue([&](const QueueItem&) {
        ++calls;
        return ReconcileOutcome{};
    }, 1, std::chrono::milliseconds(50));

    queue.start();
    auto start = std::chrono::steady_clock::now();
    queue.addAfter(Item("later"), std::chrono::milliseconds(150));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(calls.load() == 0);
    assert(WaitFor([&] { return calls.load() == 1; }));
    assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(150));

    // Stop drops what is still waiting.
    queue.addAfter(Item("never"), std::chrono::seconds(60));
    queue.stop();
    assert(queue.pendingCount() == 0);
    std::cout << "[PASS] Delayed items wait for their due time." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Reconcile Queue Test..." << std::endl;

    TestDeduplication();
    TestPerKeySerialization();
    TestRequeueDecisions();
    TestDelayedItem();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
