#include "lrucache/core/cache/ledger/EntryLedger.hpp"
#include <stdexcept>
#include <utility>

namespace lrucache {
namespace core {
namespace cache {

EntryHandle EntryLedger::insertOrReplace(std::string key, std::vector<uint8_t> value,
                                         std::optional<TimePoint> expiresAt) {
    remove(key);

    uint32_t slotIndex = allocateSlot();
    Slot& slot = slots_[slotIndex];
    slot.entry = Entry{std::move(key), std::move(value), expiresAt};
    totalBytes_ += slot.entry.value.size();
    linkFront(slotIndex);

    EntryHandle handle{slotIndex, slot.generation};
    index_.emplace(slot.entry.key, handle);
    return handle;
}

void EntryLedger::touch(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return;
    }
    uint32_t slotIndex = it->second.index;
    if (slotIndex == head_) {
        return;
    }
    unlink(slotIndex);
    linkFront(slotIndex);
}

std::optional<Entry> EntryLedger::evictOldest() {
    if (tail_ == NIL) {
        return std::nullopt;
    }
    return releaseSlot(tail_);
}

const Entry* EntryLedger::lookup(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &slots_[it->second.index].entry;
}

bool EntryLedger::remove(const std::string& key) {
    return extract(key).has_value();
}

std::optional<Entry> EntryLedger::extract(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return releaseSlot(it->second.index);
}

size_t EntryLedger::sweepExpired(TimePoint now, const RemovedCallback& onRemoved) {
    // Сначала снимок дескрипторов, потом удаление: удаление не должно
    // сбивать обход ещё не просмотренных записей.
    std::vector<EntryHandle> toVisit;
    toVisit.reserve(index_.size());
    for (uint32_t i = head_; i != NIL; i = slots_[i].next) {
        toVisit.push_back(EntryHandle{i, slots_[i].generation});
    }

    size_t removed = 0;
    for (const auto& handle : toVisit) {
        if (!isLive(handle)) {
            continue;
        }
        if (!slots_[handle.index].entry.isExpired(now)) {
            continue;
        }
        Entry entry = releaseSlot(handle.index);
        ++removed;
        if (onRemoved) {
            onRemoved(std::move(entry));
        }
    }
    return removed;
}

void EntryLedger::clear() {
    // Слоты не удаляются, чтобы старые дескрипторы остались устаревшими
    freeSlots_.clear();
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        Slot& slot = slots_[i];
        if (slot.occupied) {
            slot.entry = Entry{};
            slot.occupied = false;
            ++slot.generation;
        }
        slot.prev = NIL;
        slot.next = NIL;
        freeSlots_.push_back(i);
    }
    index_.clear();
    head_ = NIL;
    tail_ = NIL;
    totalBytes_ = 0;
}

const Entry* EntryLedger::resolve(EntryHandle handle) const {
    if (!isLive(handle)) {
        return nullptr;
    }
    return &slots_[handle.index].entry;
}

std::vector<std::string> EntryLedger::keysByRecency() const {
    std::vector<std::string> keys;
    keys.reserve(index_.size());
    for (uint32_t i = head_; i != NIL; i = slots_[i].next) {
        keys.push_back(slots_[i].entry.key);
    }
    return keys;
}

bool EntryLedger::checkInvariants() const {
    size_t listed = 0;
    size_t bytes = 0;
    uint32_t prev = NIL;
    for (uint32_t i = head_; i != NIL; i = slots_[i].next) {
        if (i >= slots_.size() || !slots_[i].occupied || slots_[i].prev != prev) {
            return false;
        }
        auto it = index_.find(slots_[i].entry.key);
        if (it == index_.end() || it->second.index != i ||
            it->second.generation != slots_[i].generation) {
            return false;
        }
        bytes += slots_[i].entry.value.size();
        prev = i;
        if (++listed > slots_.size()) {
            return false; // цикл в списке
        }
    }
    if (prev != tail_) {
        return false;
    }
    return listed == index_.size() && bytes == totalBytes_;
}

uint32_t EntryLedger::allocateSlot() {
    uint32_t slotIndex;
    if (!freeSlots_.empty()) {
        slotIndex = freeSlots_.back();
        freeSlots_.pop_back();
    } else {
        if (slots_.size() >= NIL) {
            throw std::length_error("EntryLedger: исчерпано пространство слотов");
        }
        slotIndex = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }
    slots_[slotIndex].occupied = true;
    return slotIndex;
}

Entry EntryLedger::releaseSlot(uint32_t slotIndex) {
    Slot& slot = slots_[slotIndex];
    unlink(slotIndex);
    index_.erase(slot.entry.key);
    totalBytes_ -= slot.entry.value.size();

    Entry entry = std::move(slot.entry);
    slot.entry = Entry{};
    slot.occupied = false;
    ++slot.generation;
    freeSlots_.push_back(slotIndex);
    return entry;
}

void EntryLedger::linkFront(uint32_t slotIndex) {
    Slot& slot = slots_[slotIndex];
    slot.prev = NIL;
    slot.next = head_;
    if (head_ != NIL) {
        slots_[head_].prev = slotIndex;
    }
    head_ = slotIndex;
    if (tail_ == NIL) {
        tail_ = slotIndex;
    }
}

void EntryLedger::unlink(uint32_t slotIndex) {
    Slot& slot = slots_[slotIndex];
    if (slot.prev != NIL) {
        slots_[slot.prev].next = slot.next;
    } else {
        head_ = slot.next;
    }
    if (slot.next != NIL) {
        slots_[slot.next].prev = slot.prev;
    } else {
        tail_ = slot.prev;
    }
    slot.prev = NIL;
    slot.next = NIL;
}

bool EntryLedger::isLive(EntryHandle handle) const {
    return handle.index < slots_.size() &&
           slots_[handle.index].occupied &&
           slots_[handle.index].generation == handle.generation;
}

} // namespace cache
} // namespace core
} // namespace lrucache
