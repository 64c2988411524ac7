#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <optional>
#include <chrono>
#include <cstdint>
#include <limits>

namespace lrucache {
namespace core {
namespace cache {

// Запись кэша. Принадлежит только EntryLedger
struct Entry {
    using Clock = std::chrono::steady_clock;
    std::string key;
    std::vector<uint8_t> value;
    std::optional<Clock::time_point> expiresAt; // nullopt = бессрочно

    bool isExpired(Clock::time_point now) const {
        return expiresAt.has_value() && *expiresAt < now;
    }
};

// Дескриптор записи: индекс слота + поколение.
// Дескриптор устаревает, как только слот освобождён.
struct EntryHandle {
    uint32_t index = std::numeric_limits<uint32_t>::max();
    uint32_t generation = 0;

    bool operator==(const EntryHandle& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const EntryHandle& other) const { return !(*this == other); }
};

// EntryLedger - индекс ключ -> запись и порядок по давности доступа.
// Записи лежат в арене слотов, порядок задаётся интрузивным
// двусвязным списком по индексам слотов (голова = самая свежая).
// Синхронизация - забота владельца (LruCache).
class EntryLedger {
public:
    using Clock = Entry::Clock;
    using TimePoint = Clock::time_point;
    using RemovedCallback = std::function<void(Entry&&)>;

    EntryLedger() = default;
    EntryLedger(const EntryLedger&) = delete;
    EntryLedger& operator=(const EntryLedger&) = delete;

    EntryHandle insertOrReplace(std::string key, std::vector<uint8_t> value,
                                std::optional<TimePoint> expiresAt); // Вставить/заменить
    void touch(const std::string& key); // В голову списка
    std::optional<Entry> evictOldest(); // Вытеснить хвост (nullopt если пусто)
    const Entry* lookup(const std::string& key) const; // Найти без изменения порядка
    bool remove(const std::string& key); // Удалить (идемпотентно)
    std::optional<Entry> extract(const std::string& key); // Удалить и вернуть запись
    size_t sweepExpired(TimePoint now, const RemovedCallback& onRemoved = {}); // Удалить истёкшие
    void clear(); // Очистить

    const Entry* resolve(EntryHandle handle) const; // nullptr для устаревшего дескриптора
    size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }
    size_t totalBytes() const { return totalBytes_; }
    std::vector<std::string> keysByRecency() const; // От самой свежей к самой старой
    bool checkInvariants() const; // Проверка согласованности индекса, списка и счётчика байт

private:
    static constexpr uint32_t NIL = std::numeric_limits<uint32_t>::max();

    struct Slot {
        Entry entry;
        uint32_t generation = 0;
        uint32_t prev = NIL;
        uint32_t next = NIL;
        bool occupied = false;
    };

    uint32_t allocateSlot();
    Entry releaseSlot(uint32_t slotIndex);
    void linkFront(uint32_t slotIndex);
    void unlink(uint32_t slotIndex);
    bool isLive(EntryHandle handle) const;

    std::vector<Slot> slots_;
    std::vector<uint32_t> freeSlots_;
    std::unordered_map<std::string, EntryHandle> index_;
    uint32_t head_ = NIL;
    uint32_t tail_ = NIL;
    size_t totalBytes_ = 0;
};

} // namespace cache
} // namespace core
} // namespace lrucache
