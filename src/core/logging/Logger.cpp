#include "lrucache/core/logging/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace lrucache {
namespace core {
namespace logging {

namespace {

constexpr size_t MAX_LOG_FILE_SIZE = 1024 * 1024 * 5;
constexpr size_t MAX_LOG_FILES = 2;

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

// Путь, с которым логгер был создан (пустой - stdout)
std::string& activeLogPath() {
    static std::string path;
    return path;
}

std::shared_ptr<spdlog::logger> createLogger(const std::string& logPath) {
    if (!logPath.empty()) {
        try {
            auto parent = std::filesystem::path(logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath, MAX_LOG_FILE_SIZE, MAX_LOG_FILES);
            return std::make_shared<spdlog::logger>(LOGGER_NAME, rotating_sink);
        } catch (const std::exception& e) {
            std::cerr << "lrucache: не удалось открыть лог " << logPath << ": " << e.what()
                      << ", используется stdout" << std::endl;
        }
    }
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    return std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
}

} // namespace

std::shared_ptr<spdlog::logger> getLogger(const std::string& logLevel, const std::string& logPath) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = createLogger(logPath);
        logger->set_level(spdlog::level::from_str(logLevel));
        spdlog::register_logger(logger);
        activeLogPath() = logPath;
        return logger;
    }

    // Логгер общий для процесса: настройки первого создателя не перезаписываются
    const auto requested = spdlog::level::from_str(logLevel);
    if (requested != logger->level()) {
        logger->warn("logger '{}' уже создан с уровнем {}, запрошенный уровень {} проигнорирован",
                     LOGGER_NAME, spdlog::level::to_string_view(logger->level()),
                     spdlog::level::to_string_view(requested));
    }
    if (logPath != activeLogPath()) {
        logger->warn("logger '{}' уже пишет в '{}', запрошенный путь '{}' проигнорирован",
                     LOGGER_NAME, activeLogPath().empty() ? "stdout" : activeLogPath(), logPath);
    }
    return logger;
}

} // namespace logging
} // namespace core
} // namespace lrucache
