#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace lingo {
namespace cache {

// CacheConfig — параметры кэша переводов (TTL, бюджет, сжатие, версии, префикс, логи)
struct CacheConfig {
    std::chrono::milliseconds maxAge = std::chrono::hours(24); // TTL записи
    size_t maxSize = 5 * 1024 * 1024;       // Бюджет долговременного уровня (5 MB)
    size_t compressionThreshold = 1024;     // Минимальный размер для попытки сжатия
    bool enableCompression = true;          // Сжатие
    bool enableVersioning = true;           // Версия участвует в ключе
    std::string storagePrefix = "translation_cache_"; // Пространство имён ключей
    std::string logPath = "logs/translation_cache.log";
    size_t maxLogSize = 1024 * 1024 * 5;
    size_t maxLogFiles = 2;

    bool validate() const {
        return maxAge.count() > 0 && maxSize > 0 && !storagePrefix.empty() && maxLogFiles > 0;
    }

    nlohmann::json toJson() const;
    // Отсутствующие поля сохраняют значения по умолчанию
    static CacheConfig fromJson(const nlohmann::json& j);
};

// CacheConfigPatch — частичное обновление конфигурации для updateConfig()
struct CacheConfigPatch {
    std::optional<std::chrono::milliseconds> maxAge;
    std::optional<size_t> maxSize;
    std::optional<size_t> compressionThreshold;
    std::optional<bool> enableCompression;
    std::optional<bool> enableVersioning;
    std::optional<std::string> storagePrefix;

    void applyTo(CacheConfig& config) const;
    bool empty() const;
    static CacheConfigPatch fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace lingo
