#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <spdlog/spdlog.h>

namespace lrucache {
namespace core {
namespace cache {

// Reaper - фоновый поток, периодически удаляющий истёкшие записи.
// Сам кэш не знает: на каждом тике вызывает переданную функцию очистки,
// которая берёт блокировку кэша и возвращает число удалённых записей.
class Reaper {
public:
    using SweepFunction = std::function<size_t()>;

    Reaper(std::chrono::milliseconds interval, SweepFunction sweep,
           std::shared_ptr<spdlog::logger> logger = nullptr); // Конструктор
    ~Reaper(); // Деструктор (останавливает поток)
    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void start(); // Запустить поток (повторный вызов - no-op)
    void stop(); // Остановить и дождаться потока (идемпотентно)
    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    std::chrono::milliseconds interval() const { return interval_; }
    size_t tickCount() const { return ticks_.load(std::memory_order_relaxed); }
    size_t reclaimedCount() const { return reclaimed_.load(std::memory_order_relaxed); }

private:
    void threadFunc();
    bool waitForNextTick();

    std::chrono::milliseconds interval_;
    SweepFunction sweep_;
    std::shared_ptr<spdlog::logger> logger_;
    std::thread thread_;
    std::mutex lifecycleMutex_; // start/stop
    std::mutex waitMutex_;      // только для ожидания на cv_
    std::condition_variable cv_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<size_t> ticks_{0};
    std::atomic<size_t> reclaimed_{0};
};

} // namespace cache
} // namespace core
} // namespace lrucache
