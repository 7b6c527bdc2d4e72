#include "lingo/cache/logging/CacheLogger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace lingo {
namespace cache {
namespace logging {

namespace {
std::mutex initMutex;
}

std::shared_ptr<spdlog::logger> initialize(const std::string& logPath, size_t maxSize, size_t maxFiles) {
    std::lock_guard<std::mutex> lock(initMutex);
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }
    try {
        auto parent = std::filesystem::path(logPath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, maxSize, maxFiles);
        rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, rotating_sink);
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        return logger;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера кэша переводов: " << e.what() << std::endl;
        return spdlog::default_logger();
    }
}

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }
    return spdlog::default_logger();
}

} // namespace logging
} // namespace cache
} // namespace lingo
