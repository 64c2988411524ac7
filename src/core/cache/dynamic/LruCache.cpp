#include "lrucache/core/cache/dynamic/LruCache.hpp"
#include "lrucache/core/cache/ledger/EntryLedger.hpp"
#include "lrucache/core/cache/reaper/Reaper.hpp"
#include "lrucache/core/logging/Logger.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace lrucache {
namespace core {
namespace cache {

namespace {

// now + ttl с насыщением: часы считают в наносекундах, и ttl больше
// ~292 лет переполняет сложение. Такой срок упирается в time_point::max().
LruCache::Clock::time_point deadlineAfter(LruCache::Clock::time_point now, std::chrono::milliseconds ttl) {
    using std::chrono::milliseconds;
    using TimePoint = LruCache::Clock::time_point;
    const auto limit = std::chrono::duration_cast<milliseconds>(LruCache::Clock::duration::max());
    const auto nowMs = std::chrono::duration_cast<milliseconds>(now.time_since_epoch());
    if (ttl >= limit || ttl >= limit - nowMs) {
        return TimePoint::max();
    }
    if (ttl <= -limit || ttl <= -limit - nowMs) {
        return TimePoint::min();
    }
    return now + std::chrono::duration_cast<LruCache::Clock::duration>(ttl);
}

} // namespace

const char* toString(EvictionReason reason) {
    switch (reason) {
        case EvictionReason::Capacity: return "capacity";
        case EvictionReason::Expired: return "expired";
        case EvictionReason::Removed: return "removed";
    }
    return "unknown";
}

// Реализация PIMPL
struct LruCache::Impl {
    CacheConfig config;
    size_t capacity;
    EntryLedger ledger;
    CacheMetrics metrics;
    EvictionCallback evictionCallback;
    std::shared_ptr<spdlog::logger> logger;
    mutable std::mutex mutex; // Единственная блокировка ledger, metrics и evictionCallback
    std::unique_ptr<Reaper> reaper; // Последним: разрушается первым

    explicit Impl(const CacheConfig& cfg)
        : config(cfg.normalized()), capacity(config.capacityBytes()),
          logger(logging::getLogger(config.logLevel, config.logPath)) {
        metrics.maxSize = capacity;
    }

    // Вызывается под mutex, после того как ledger уже в итоговом состоянии.
    // std::exception из callback логируется; прочие исключения уходят
    // вызывающему, но операция к этому моменту завершена.
    void notifyRemoved(const Entry& entry, EvictionReason reason) {
        logger->debug("LruCache: запись удалена: key={}, size={}, reason={}",
                      entry.key, entry.value.size(), toString(reason));
        if (!evictionCallback) {
            return;
        }
        try {
            evictionCallback(entry.key, entry.value, reason);
        } catch (const std::exception& e) {
            logger->error("LruCache: ошибка в callback вытеснения для key={}: {}", entry.key, e.what());
        }
    }

    // Вызывается под mutex
    size_t sweepLocked(EntryLedger::TimePoint now) {
        std::vector<Entry> expired;
        size_t removed = ledger.sweepExpired(now, [&expired](Entry&& entry) {
            expired.push_back(std::move(entry));
        });
        metrics.expirationCount += removed;
        ++metrics.sweepCount;
        for (const auto& entry : expired) {
            notifyRemoved(entry, EvictionReason::Expired);
        }
        return removed;
    }

    size_t sweep() {
        std::lock_guard<std::mutex> lock(mutex);
        return sweepLocked(Clock::now());
    }
};

LruCache::LruCache(const CacheConfig& config) {
    if (!config.validate()) {
        throw std::runtime_error("LruCache: некорректная конфигурация кэша (logLevel='" + config.logLevel + "')");
    }
    pImpl = std::make_unique<Impl>(config);

    if (pImpl->config.reaperEnabled()) {
        Impl* impl = pImpl.get();
        pImpl->reaper = std::make_unique<Reaper>(
            pImpl->config.cleanInterval, [impl] { return impl->sweep(); }, pImpl->logger);
        pImpl->reaper->start();
    }

    pImpl->logger->info("LruCache: создан с параметрами: maxSize={}, defaultExpire={} ms, cleanInterval={} ms",
                        pImpl->capacity, pImpl->config.defaultExpire.count(),
                        pImpl->config.cleanInterval.count());
}

LruCache::~LruCache() {
    close();
}

void LruCache::store(const std::string& key, Value value, std::optional<std::chrono::milliseconds> ttl) {
    const auto now = Clock::now();
    std::optional<Clock::time_point> expiresAt;
    if (ttl) {
        expiresAt = deadlineAfter(now, *ttl);
    } else if (pImpl->config.defaultExpire.count() > 0) {
        expiresAt = deadlineAfter(now, pImpl->config.defaultExpire);
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto& ledger = pImpl->ledger;

    if (value.size() > pImpl->capacity) {
        ++pImpl->metrics.rejectedCount;
        pImpl->logger->warn("LruCache: значение отклонено: key={}, size={}, capacity={}",
                            key, value.size(), pImpl->capacity);
        throw ValueTooLargeError(key, value.size(), pImpl->capacity);
    }

    // Старое значение под тем же ключом не должно участвовать в расчёте места
    ledger.remove(key);

    std::vector<Entry> evicted;
    while (ledger.totalBytes() + value.size() > pImpl->capacity) {
        auto oldest = ledger.evictOldest();
        if (!oldest) {
            break;
        }
        ++pImpl->metrics.evictionCount;
        evicted.push_back(std::move(*oldest));
    }

    const size_t size = value.size();
    ledger.insertOrReplace(key, std::move(value), expiresAt);
    ++pImpl->metrics.storeCount;
    pImpl->logger->debug("LruCache: сохранено: key={}, size={}, total={}", key, size, ledger.totalBytes());

    // Уведомления только после вставки: store не остаётся наполовину выполненным
    for (const auto& entry : evicted) {
        pImpl->notifyRemoved(entry, EvictionReason::Capacity);
    }
}

std::optional<LruCache::Value> LruCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto& ledger = pImpl->ledger;

    const Entry* entry = ledger.lookup(key);
    if (!entry) {
        ++pImpl->metrics.missCount;
        return std::nullopt;
    }

    if (entry->isExpired(Clock::now())) {
        auto expired = ledger.extract(key);
        ++pImpl->metrics.expirationCount;
        ++pImpl->metrics.missCount;
        pImpl->notifyRemoved(*expired, EvictionReason::Expired);
        return std::nullopt;
    }

    ledger.touch(key);
    ++pImpl->metrics.hitCount;
    return entry->value;
}

bool LruCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto removed = pImpl->ledger.extract(key);
    if (!removed) {
        return false;
    }
    pImpl->notifyRemoved(*removed, EvictionReason::Removed);
    return true;
}

void LruCache::clear() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->evictionCallback) {
        pImpl->ledger.clear();
    } else {
        std::vector<Entry> removed;
        while (auto oldest = pImpl->ledger.evictOldest()) {
            removed.push_back(std::move(*oldest));
        }
        for (const auto& entry : removed) {
            pImpl->notifyRemoved(entry, EvictionReason::Removed);
        }
    }
    pImpl->logger->debug("LruCache: кэш очищен");
}

size_t LruCache::sweepExpired() {
    return pImpl->sweep();
}

void LruCache::close() {
    // Без блокировки кэша: поток Reaper может ждать её внутри очистки
    if (pImpl && pImpl->reaper) {
        pImpl->reaper->stop();
    }
}

bool LruCache::isReaperRunning() const {
    return pImpl->reaper && pImpl->reaper->isRunning();
}

size_t LruCache::sizeBytes() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->ledger.totalBytes();
}

size_t LruCache::entryCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->ledger.size();
}

size_t LruCache::capacityBytes() const {
    return pImpl->capacity;
}

std::vector<std::string> LruCache::keysByRecency() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->ledger.keysByRecency();
}

CacheMetrics LruCache::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    CacheMetrics snapshot = pImpl->metrics;
    snapshot.currentSize = pImpl->ledger.totalBytes();
    snapshot.entryCount = pImpl->ledger.size();
    snapshot.lastUpdate = std::chrono::steady_clock::now();
    return snapshot;
}

const CacheConfig& LruCache::getConfiguration() const {
    return pImpl->config;
}

void LruCache::setEvictionCallback(EvictionCallback cb) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->evictionCallback = std::move(cb);
}

} // namespace cache
} // namespace core
} // namespace lrucache
