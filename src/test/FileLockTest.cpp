#include <cassert>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include "infrastructure/ArtifactStorage.hpp"
#include "infrastructure/FileLock.hpp"
#include "test/TestSupport.hpp"

using namespace chartkeeper;
namespace fs = std::filesystem;

namespace {

void TestMutualExclusion(const test::TempDir& root) {
    infrastructure::FileLockManager locks;
    std::string lockPath = (root.path() / "kind" / "ns" / "name.lock").string();

    std::atomic<int> inside{0};
    std::atomic<bool> overlap{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 25; ++j) {
                auto lock = locks.acquire(lockPath);
                if (++inside > 1) overlap = true;
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                --inside;
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(!overlap);
    assert(locks.activeKeys() == 0);
    assert(fs::exists(lockPath));
    std::cout << "[PASS] One holder at a time per key." << std::endl;
}

void TestIndependentKeys(const test::TempDir& root) {
    infrastructure::FileLockManager locks;
    auto first = locks.acquire((root.path() / "a.lock").string());

    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        auto second = locks.acquire((root.path() / "b.lock").string());
        acquired = true;
    });
    other.join();
    assert(acquired);
    assert(locks.activeKeys() == 1);
    std::cout << "[PASS] Different keys do not contend." << std::endl;
}

void TestMoveAndRelease(const test::TempDir& root) {
    infrastructure::FileLockManager locks;
    std::string path = (root.path() / "move.lock").string();

    infrastructure::ArtifactLock held = locks.acquire(path);
    assert(held.ownsLock());
    assert(held.key() == path);

    infrastructure::ArtifactLock moved = std::move(held);
    assert(!held.ownsLock());
    assert(moved.ownsLock());

    moved.release();
    moved.release();
    assert(!moved.ownsLock());
    assert(locks.activeKeys() == 0);

    // Re-acquirable once released.
    auto again = locks.acquire(path);
    assert(again.ownsLock());
    std::cout << "[PASS] Move and idempotent release." << std::endl;
}

void TestConcurrentReadersSeeWholeFiles(const test::TempDir& root) {
    infrastructure::ArtifactStorage storage(root.str(), "http://h");
    auto artifact = storage.newArtifactFor(domain::ResourceKind::HelmChart, {"default", "atomic"}, "1", "chart.tgz");
    const std::string small(64 * 1024, 'a');
    const std::string large(1024 * 1024, 'b');
    storage.atomicWrite(artifact, small);

    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};
    std::atomic<int> reads{0};

    std::thread writer([&]() {
        for (int i = 0; i < 40; ++i) {
            auto lock = storage.lock(artifact);
            storage.atomicWrite(artifact, (i % 2) ? small : large);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            do {
                std::string data = storage.readFile(artifact);
                if (data != small && data != large) torn = true;
                ++reads;
            } while (!done);
        });
    }

    writer.join();
    for (auto& t : readers) t.join();
    assert(!torn);
    assert(reads > 0);
    std::cout << "[PASS] Readers observed only complete files (" << reads << " reads)." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting File Lock Test..." << std::endl;
    test::TempDir root;

    TestMutualExclusion(root);
    TestIndependentKeys(root);
    TestMoveAndRelease(root);
    TestConcurrentReadersSeeWholeFiles(root);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
