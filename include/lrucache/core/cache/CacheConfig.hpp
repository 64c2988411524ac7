#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace lrucache {
namespace core {
namespace cache {

// Ёмкость по умолчанию, если maxSize <= 0 (64 MiB)
constexpr std::int64_t DEFAULT_MAX_SIZE = 64 * 1024 * 1024;

// CacheConfig - параметры кэша (ёмкость, TTL по умолчанию, интервал очистки, логирование)
struct CacheConfig {
    std::int64_t maxSize = 0;                                   // Ёмкость в байтах (<= 0 -> 64 MiB)
    std::chrono::milliseconds defaultExpire{0};                 // TTL по умолчанию (0 = бессрочно)
    std::chrono::milliseconds cleanInterval{0};                 // Период Reaper (<= 0 -> выключен)
    std::string logLevel = "info";                              // Уровень spdlog
    std::string logPath;                                        // Файл лога (пусто -> stdout)

    bool validate() const; // Проверка
    CacheConfig normalized() const; // Копия с применёнными значениями по умолчанию
    std::size_t capacityBytes() const; // Итоговая ёмкость
    bool reaperEnabled() const { return cleanInterval.count() > 0; }

    nlohmann::json toJson() const;
    static CacheConfig fromJson(const nlohmann::json& j);
    static CacheConfig loadFromFile(const std::string& path);
};

} // namespace cache
} // namespace core
} // namespace lrucache
