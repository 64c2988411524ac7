#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace lrucache {
namespace core {
namespace cache {

// CacheMetrics - счётчики кэша (размер, записи, попадания, вытеснения, истечения)
struct CacheMetrics {
    size_t currentSize = 0;      // Текущий размер (байт)
    size_t maxSize = 0;          // Ёмкость (байт)
    size_t entryCount = 0;       // Кол-во записей
    size_t storeCount = 0;       // Успешные store
    size_t rejectedCount = 0;    // Отклонённые store (ValueTooLarge)
    size_t hitCount = 0;         // Попадания get
    size_t missCount = 0;        // Промахи get
    size_t evictionCount = 0;    // Вытеснения по ёмкости
    size_t expirationCount = 0;  // Удаления по TTL (ленивые и Reaper)
    size_t sweepCount = 0;       // Проходы очистки
    std::chrono::steady_clock::time_point lastUpdate; // Последнее обновление

    double hitRate() const {
        auto total = hitCount + missCount;
        return total > 0 ? static_cast<double>(hitCount) / total : 0.0;
    }

    nlohmann::json toJson() const {
        return {
            {"currentSize", currentSize},
            {"maxSize", maxSize},
            {"entryCount", entryCount},
            {"storeCount", storeCount},
            {"rejectedCount", rejectedCount},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"hitRate", hitRate()},
            {"evictionCount", evictionCount},
            {"expirationCount", expirationCount},
            {"sweepCount", sweepCount},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace lrucache
