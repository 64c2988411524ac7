#include "lrucache/core/cache/reaper/Reaper.hpp"
#include <sstream>
#include <stdexcept>

namespace lrucache {
namespace core {
namespace cache {

Reaper::Reaper(std::chrono::milliseconds interval, SweepFunction sweep,
               std::shared_ptr<spdlog::logger> logger)
    : interval_(interval), sweep_(std::move(sweep)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Reaper: интервал должен быть положительным");
    }
    if (!sweep_) {
        throw std::invalid_argument("Reaper: не задана функция очистки");
    }
}

Reaper::~Reaper() {
    stop();
}

void Reaper::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    stopRequested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] {
        threadFunc();
    });

    logger_->info("Reaper: фоновый поток запущен с интервалом {} ms", interval_.count());
}

void Reaper::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    stopRequested_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> waitLock(waitMutex_);
        cv_.notify_all();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
    logger_->info("Reaper: фоновый поток остановлен после {} тиков", ticks_.load());
}

bool Reaper::waitForNextTick() {
    std::unique_lock<std::mutex> lock(waitMutex_);
    return !cv_.wait_for(lock, interval_, [this] {
        return stopRequested_.load(std::memory_order_acquire);
    });
}

void Reaper::threadFunc() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    logger_->debug("Reaper: поток стартует (thread_id={})", oss.str());

    while (waitForNextTick()) {
        try {
            size_t removed = sweep_();
            ticks_.fetch_add(1, std::memory_order_relaxed);
            reclaimed_.fetch_add(removed, std::memory_order_relaxed);
            if (removed > 0) {
                logger_->debug("Reaper: удалено {} истёкших записей", removed);
            }
        } catch (const std::exception& e) {
            logger_->error("Reaper: ошибка очистки: {}", e.what());
        }
    }

    logger_->debug("Reaper: поток завершён (thread_id={})", oss.str());
}

} // namespace cache
} // namespace core
} // namespace lrucache
