#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "lrucache/core/cache/CacheConfig.hpp"
#include "lrucache/core/cache/dynamic/LruCache.hpp"
#include "lrucache/core/logging/Logger.hpp"

using namespace lrucache::core::cache;
using namespace std::chrono_literals;

void smokeTestCacheConfig() {
    std::cout << "Testing CacheConfig defaults...\n";

    CacheConfig config;
    assert(config.validate());
    assert(config.capacityBytes() == static_cast<size_t>(DEFAULT_MAX_SIZE));
    assert(!config.reaperEnabled());

    auto normalized = config.normalized();
    assert(normalized.maxSize == 64 * 1024 * 1024);
    assert(normalized.defaultExpire == 0ms);
    assert(normalized.cleanInterval == 0ms);

    CacheConfig negative;
    negative.maxSize = -1;
    negative.cleanInterval = -10ms;
    negative.defaultExpire = -10ms;
    normalized = negative.normalized();
    assert(normalized.maxSize == DEFAULT_MAX_SIZE);
    assert(!normalized.reaperEnabled());
    assert(normalized.defaultExpire == 0ms);

    std::cout << "[OK] CacheConfig smoke test\n";
}

void testCacheConfigJson() {
    std::cout << "Testing CacheConfig JSON...\n";

    auto j = nlohmann::json::parse(R"({
        "maxSize": 1048576,
        "defaultExpireMs": 1500,
        "cleanIntervalMs": 250,
        "logLevel": "debug"
    })");
    auto config = CacheConfig::fromJson(j);
    assert(config.maxSize == 1048576);
    assert(config.defaultExpire == 1500ms);
    assert(config.cleanInterval == 250ms);
    assert(config.logLevel == "debug");
    assert(config.logPath.empty());

    auto back = CacheConfig::fromJson(config.toJson());
    assert(back.maxSize == config.maxSize);
    assert(back.cleanInterval == config.cleanInterval);

    // Отсутствующие поля берутся по умолчанию
    auto partial = CacheConfig::fromJson(nlohmann::json::object());
    assert(partial.maxSize == 0);
    assert(partial.logLevel == "info");

    std::cout << "[OK] CacheConfig JSON test\n";
}

void testCacheConfigErrors() {
    std::cout << "Testing CacheConfig error handling...\n";

    auto expectThrow = [](const nlohmann::json& j) {
        try {
            CacheConfig::fromJson(j);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    assert(expectThrow(nlohmann::json::array()));
    assert(expectThrow(nlohmann::json{{"maxSize", "big"}}));
    assert(expectThrow(nlohmann::json{{"logLevel", "loud"}}));

    bool thrown = false;
    try {
        CacheConfig::loadFromFile("does/not/exist.json");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    auto badPath = std::filesystem::temp_directory_path() / "lrucache_bad_config.json";
    {
        std::ofstream out(badPath);
        out << "not-json";
    }
    thrown = false;
    try {
        CacheConfig::loadFromFile(badPath.string());
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::filesystem::remove(badPath);

    CacheConfig invalid;
    invalid.logLevel = "loud";
    thrown = false;
    try {
        LruCache cache(invalid);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] CacheConfig error test\n";
}

void testCacheConfigFromFile() {
    std::cout << "Testing CacheConfig loadFromFile...\n";

    auto path = std::filesystem::temp_directory_path() / "lrucache_config.json";
    {
        std::ofstream out(path);
        out << R"({"maxSize": 256, "cleanIntervalMs": 50, "logLevel": "warn"})";
    }
    auto config = CacheConfig::loadFromFile(path.string());
    std::filesystem::remove(path);

    LruCache cache(config);
    assert(cache.capacityBytes() == 256);
    assert(cache.isReaperRunning());
    cache.close();
    assert(!cache.isReaperRunning());

    std::cout << "[OK] CacheConfig file test\n";
}

void testSharedLoggerSettings() {
    std::cout << "Testing shared logger keeps its first settings...\n";

    auto first = lrucache::core::logging::getLogger("warn");
    auto level = first->level();

    CacheConfig quiet;
    quiet.maxSize = 128;
    quiet.logLevel = "off";
    quiet.logPath = (std::filesystem::temp_directory_path() / "lrucache_ignored.log").string();
    LruCache cache(quiet);

    auto again = lrucache::core::logging::getLogger("off");
    assert(again == first);
    assert(again->level() == level);
    assert(again->level() != spdlog::level::off);

    std::cout << "[OK] Shared logger test\n";
}

int main() {
    try {
        smokeTestCacheConfig();
        testCacheConfigJson();
        testCacheConfigErrors();
        testCacheConfigFromFile();
        testSharedLoggerSettings();
        std::cout << "All CacheConfig tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
