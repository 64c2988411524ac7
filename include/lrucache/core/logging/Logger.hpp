#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace lrucache {
namespace core {
namespace logging {

// Имя общего логгера библиотеки в реестре spdlog
constexpr const char* LOGGER_NAME = "lrucache";

// Возвращает логгер "lrucache", создавая его при первом обращении.
// logPath пустой -> stdout, иначе ротируемый файл (5 MiB x 2).
// Уровень и путь берутся из первого вызова; расхождение в последующих
// вызовах только логируется предупреждением.
std::shared_ptr<spdlog::logger> getLogger(const std::string& logLevel = "info",
                                          const std::string& logPath = "");

} // namespace logging
} // namespace core
} // namespace lrucache
