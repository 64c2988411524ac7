#include "lrucache/core/cache/CacheConfig.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

namespace lrucache {
namespace core {
namespace cache {

bool CacheConfig::validate() const {
    return spdlog::level::from_str(logLevel) != spdlog::level::off || logLevel == "off";
}

CacheConfig CacheConfig::normalized() const {
    CacheConfig result = *this;
    if (result.maxSize <= 0) {
        result.maxSize = DEFAULT_MAX_SIZE;
    }
    if (result.defaultExpire.count() < 0) {
        result.defaultExpire = std::chrono::milliseconds(0);
    }
    if (result.cleanInterval.count() < 0) {
        result.cleanInterval = std::chrono::milliseconds(0);
    }
    return result;
}

std::size_t CacheConfig::capacityBytes() const {
    return static_cast<std::size_t>(maxSize > 0 ? maxSize : DEFAULT_MAX_SIZE);
}

nlohmann::json CacheConfig::toJson() const {
    return {
        {"maxSize", maxSize},
        {"defaultExpireMs", defaultExpire.count()},
        {"cleanIntervalMs", cleanInterval.count()},
        {"logLevel", logLevel},
        {"logPath", logPath}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("CacheConfig: ожидался JSON-объект");
    }
    CacheConfig config;
    try {
        if (j.contains("maxSize")) {
            config.maxSize = j.at("maxSize").get<std::int64_t>();
        }
        if (j.contains("defaultExpireMs")) {
            config.defaultExpire = std::chrono::milliseconds(j.at("defaultExpireMs").get<std::int64_t>());
        }
        if (j.contains("cleanIntervalMs")) {
            config.cleanInterval = std::chrono::milliseconds(j.at("cleanIntervalMs").get<std::int64_t>());
        }
        if (j.contains("logLevel")) {
            config.logLevel = j.at("logLevel").get<std::string>();
        }
        if (j.contains("logPath")) {
            config.logPath = j.at("logPath").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("CacheConfig: некорректное поле: ") + e.what());
    }
    if (!config.validate()) {
        throw std::runtime_error("CacheConfig: неизвестный уровень логирования '" + config.logLevel + "'");
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("CacheConfig: не удалось открыть файл " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("CacheConfig: ошибка разбора " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace cache
} // namespace core
} // namespace lrucache
