#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace lrucache {
namespace core {
namespace cache {

// Коды ошибок кэша
enum class CacheErrc {
    NotFound,      // Ключ отсутствует или истёк к моменту чтения
    ValueTooLarge  // Значение само по себе больше ёмкости
};

inline const char* toString(CacheErrc code) {
    switch (code) {
        case CacheErrc::NotFound: return "NotFound";
        case CacheErrc::ValueTooLarge: return "ValueTooLarge";
    }
    return "Unknown";
}

// CacheError - базовое исключение кэша
class CacheError : public std::runtime_error {
public:
    CacheError(CacheErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    CacheErrc code() const noexcept { return code_; }
private:
    CacheErrc code_;
};

class ValueTooLargeError : public CacheError {
public:
    ValueTooLargeError(const std::string& key, std::size_t valueSize, std::size_t capacity)
        : CacheError(CacheErrc::ValueTooLarge,
                     "value for key '" + key + "' is " + std::to_string(valueSize) +
                     " bytes, capacity is " + std::to_string(capacity)),
          valueSize_(valueSize), capacity_(capacity) {}
    std::size_t valueSize() const noexcept { return valueSize_; }
    std::size_t capacity() const noexcept { return capacity_; }
private:
    std::size_t valueSize_;
    std::size_t capacity_;
};

} // namespace cache
} // namespace core
} // namespace lrucache
