#include <cassert>
#include <iostream>
#include <atomic>
#include <stdexcept>
#include <chrono>
#include <thread>
#include <vector>
#include "lrucache/core/cache/dynamic/LruCache.hpp"
#include "lrucache/core/cache/reaper/Reaper.hpp"

using namespace lrucache::core::cache;
using namespace std::chrono_literals;

namespace {

// Ожидание условия с таймаутом вместо фиксированного сна
template<typename Predicate>
bool waitUntil(Predicate pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

} // namespace

void smokeTestReaper() {
    std::cout << "Testing Reaper start/stop...\n";

    std::atomic<int> calls{0};
    Reaper reaper(10ms, [&calls] {
        calls.fetch_add(1);
        return size_t{0};
    });
    assert(!reaper.isRunning());

    reaper.start();
    reaper.start(); // повторный запуск ничего не делает
    assert(reaper.isRunning());
    assert(waitUntil([&] { return calls.load() >= 3; }, 2000ms));

    reaper.stop();
    assert(!reaper.isRunning());
    int afterStop = calls.load();
    std::this_thread::sleep_for(50ms);
    assert(calls.load() == afterStop);

    reaper.stop(); // идемпотентно
    assert(reaper.tickCount() == static_cast<size_t>(afterStop));

    std::cout << "[OK] Reaper smoke test\n";
}

void testReaperStopIsPrompt() {
    std::cout << "Testing Reaper stop interrupts the wait...\n";

    Reaper reaper(std::chrono::hours(1), [] { return size_t{0}; });
    reaper.start();

    auto start = std::chrono::steady_clock::now();
    reaper.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed < 1s);
    assert(reaper.tickCount() == 0);

    std::cout << "[OK] Reaper prompt stop test\n";
}

void testReaperSurvivesSweepErrors() {
    std::cout << "Testing Reaper keeps ticking after a failed sweep...\n";

    std::atomic<int> calls{0};
    Reaper reaper(5ms, [&calls]() -> size_t {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("sweep failed");
        }
        return 1;
    });
    reaper.start();
    assert(waitUntil([&] { return reaper.reclaimedCount() >= 2; }, 2000ms));
    reaper.stop();

    std::cout << "[OK] Reaper error handling test\n";
}

void testReaperInvalidArguments() {
    std::cout << "Testing Reaper argument validation...\n";

    bool thrown = false;
    try {
        Reaper reaper(0ms, [] { return size_t{0}; });
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        Reaper reaper(10ms, Reaper::SweepFunction{});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] Reaper argument test\n";
}

void testCacheReaperReclaims() {
    std::cout << "Testing LruCache background reclamation...\n";

    CacheConfig config;
    config.maxSize = 4096;
    config.cleanInterval = 20ms;
    config.logLevel = "warn";
    LruCache cache(config);
    assert(cache.isReaperRunning());

    cache.store("expiring", std::vector<uint8_t>(100, 1), 10ms);
    cache.store("kept", std::vector<uint8_t>(50, 2));
    assert(cache.sizeBytes() == 150);

    // Без единого get запись должна исчезнуть из хранилища
    assert(waitUntil([&] { return cache.entryCount() == 1; }, 2000ms));
    assert(cache.sizeBytes() == 50);
    assert(cache.get("kept"));

    auto metrics = cache.getMetrics();
    assert(metrics.expirationCount == 1);
    assert(metrics.missCount == 0);
    assert(metrics.sweepCount >= 1);

    std::cout << "[OK] LruCache reclamation test\n";
}

void testCacheReaperDisabled() {
    std::cout << "Testing LruCache without Reaper...\n";

    CacheConfig config;
    config.maxSize = 4096;
    config.cleanInterval = -1ms;
    config.logLevel = "warn";
    LruCache cache(config);
    assert(!cache.isReaperRunning());

    cache.store("expiring", std::vector<uint8_t>(100, 1), 5ms);
    std::this_thread::sleep_for(40ms);
    // Физически ещё на месте, но логически отсутствует
    assert(cache.entryCount() == 1);
    assert(!cache.get("expiring"));
    assert(cache.entryCount() == 0);

    cache.store("manual", std::vector<uint8_t>(10, 1), 1ms);
    std::this_thread::sleep_for(5ms);
    assert(cache.sweepExpired() == 1);
    assert(cache.sizeBytes() == 0);

    cache.close(); // без Reaper - no-op
    std::cout << "[OK] LruCache no-Reaper test\n";
}

void testCacheClose() {
    std::cout << "Testing LruCache close...\n";

    CacheConfig config;
    config.maxSize = 1024;
    config.cleanInterval = 10ms;
    config.logLevel = "warn";
    LruCache cache(config);
    assert(cache.isReaperRunning());

    std::vector<std::thread> closers;
    for (int i = 0; i < 4; ++i) {
        closers.emplace_back([&cache] { cache.close(); });
    }
    for (auto& t : closers) {
        t.join();
    }
    assert(!cache.isReaperRunning());
    cache.close();

    // После close кэш продолжает работать
    cache.store("after", std::vector<uint8_t>(16, 3));
    auto v = cache.get("after");
    assert(v && v->size() == 16);

    // Истёкшие записи больше не убираются в фоне, но get их не вернёт
    cache.store("ttl", std::vector<uint8_t>(8, 4), 5ms);
    std::this_thread::sleep_for(40ms);
    assert(cache.entryCount() == 2);
    assert(!cache.get("ttl"));

    std::cout << "[OK] LruCache close test\n";
}

int main() {
    try {
        smokeTestReaper();
        testReaperStopIsPrompt();
        testReaperSurvivesSweepErrors();
        testReaperInvalidArguments();
        testCacheReaperReclaims();
        testCacheReaperDisabled();
        testCacheClose();
        std::cout << "All Reaper tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
