#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace lingo {
namespace cache {
namespace logging {

constexpr const char* LOGGER_NAME = "translationcache";

// Создаёт и регистрирует логгер с rotating file sink, если его ещё нет.
// При ошибке создания sink используется логгер spdlog по умолчанию.
std::shared_ptr<spdlog::logger> initialize(const std::string& logPath, size_t maxSize, size_t maxFiles);

// Зарегистрированный логгер кэша или логгер spdlog по умолчанию
std::shared_ptr<spdlog::logger> get();

} // namespace logging
} // namespace cache
} // namespace lingo
