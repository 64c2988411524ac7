#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "lrucache/core/cache/CacheConfig.hpp"
#include "lrucache/core/cache/CacheError.hpp"
#include "lrucache/core/cache/metrics/CacheMetrics.hpp"

namespace lrucache {
namespace core {
namespace cache {

// Причина ухода записи из кэша
enum class EvictionReason {
    Capacity, // Вытеснена по ёмкости при store
    Expired,  // Истёк TTL (get или Reaper)
    Removed   // remove/clear
};

const char* toString(EvictionReason reason);

// LruCache - потокобезопасный кэш байтовых значений с ограничением
// по суммарному размеру, LRU-вытеснением и TTL.
//
// Все операции сериализуются одним мьютексом на экземпляр. Истёкшая запись
// никогда не возвращается из get, даже если Reaper её ещё не удалил.
// Если cleanInterval > 0, фоновый Reaper периодически удаляет истёкшие
// записи; close() останавливает его синхронно, сам кэш остаётся рабочим.
class LruCache {
public:
    using Value = std::vector<uint8_t>;
    using Clock = std::chrono::steady_clock;
    using EvictionCallback = std::function<void(const std::string&, const Value&, EvictionReason)>;

    explicit LruCache(const CacheConfig& config = CacheConfig{}); // Конструктор
    ~LruCache(); // Деструктор (вызывает close)
    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    // Сохранить значение. ttl задан -> истекает через ttl, иначе через
    // defaultExpire (если он не нулевой), иначе бессрочно.
    // Бросает ValueTooLargeError, если value.size() > capacityBytes();
    // содержимое кэша при этом не меняется.
    void store(const std::string& key, Value value,
               std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Копия значения или nullopt (NotFound), если ключа нет или он истёк
    std::optional<Value> get(const std::string& key);

    bool remove(const std::string& key); // Удалить
    void clear(); // Очистить
    size_t sweepExpired(); // Синхронная очистка истёкших
    void close(); // Остановить Reaper (идемпотентно)
    bool isReaperRunning() const; // Reaper работает?

    size_t sizeBytes() const; // Занято байт
    size_t entryCount() const; // Кол-во записей
    size_t capacityBytes() const; // Ёмкость
    std::vector<std::string> keysByRecency() const; // Ключи от свежих к старым
    CacheMetrics getMetrics() const; // Метрики
    const CacheConfig& getConfiguration() const; // Итоговый конфиг

    // Вызывается под блокировкой кэша; не должен обращаться к этому же кэшу.
    // Должен быть фактически noexcept: std::exception логируется, прочие
    // исключения пробрасываются уже после завершения операции (store,
    // clear, sweepExpired), а в потоке Reaper приводят к std::terminate.
    void setEvictionCallback(EvictionCallback cb);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace lrucache
