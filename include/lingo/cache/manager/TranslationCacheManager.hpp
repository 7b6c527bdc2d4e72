#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "lingo/cache/CacheConfig.hpp"
#include "lingo/cache/CachedEntry.hpp"
#include "lingo/cache/integrity/IntegrityScanner.hpp"
#include "lingo/cache/metrics/CacheStats.hpp"
#include "lingo/cache/storage/StorageAdapter.hpp"

namespace lingo {
namespace cache {

// Источник времени: миллисекунды с эпохи
using Clock = std::function<int64_t()>;
// Загрузка бандла языка; может выполняться асинхронно и завершаться ошибкой независимо
using FetchFunction = std::function<std::future<TranslationBundle>(const std::string& language)>;

// PreloadReport — итог preload()
struct PreloadReport {
    size_t loaded = 0;  // Загружено и сохранено
    size_t skipped = 0; // Уже было в кэше
    size_t failed = 0;  // Ошибка fetch или записи
};

int64_t systemClockMillis();

// TranslationCacheManager — двухуровневый кэш бандлов переводов (память + StorageAdapter).
// Бюджет байт, сжатие, вытеснение по времени записи, версии, проверка целостности.
// Единственный писатель хранилища; внешние изменения тех же ключей не отслеживаются.
class TranslationCacheManager {
public:
    // Бросает std::invalid_argument при пустом хранилище или некорректной конфигурации
    TranslationCacheManager(std::shared_ptr<storage::StorageAdapter> storage,
                            const CacheConfig& config = CacheConfig{},
                            Clock clock = systemClockMillis);
    ~TranslationCacheManager();
    TranslationCacheManager(const TranslationCacheManager&) = delete;
    TranslationCacheManager& operator=(const TranslationCacheManager&) = delete;

    std::optional<CachedEntry> get(const std::string& language,
                                   const std::optional<std::string>& version = std::nullopt);
    // Бросает CacheWriteError, если хранилище отказало в записи
    void set(const std::string& language, const TranslationMap& data, const BundleMetadata& metadata);
    void remove(const std::string& language, const std::optional<std::string>& version = std::nullopt);
    void clear();
    size_t clearExpired();
    // Никогда не бросает; завершается, когда все загрузки завершились
    PreloadReport preload(const std::vector<std::string>& languages, const FetchFunction& fetchFn);
    metrics::CacheStats getStats() const;
    integrity::IntegrityReport validateIntegrity() const;
    // Действует со следующей операции; уже сохранённые записи не перепроверяются
    void updateConfig(const CacheConfigPatch& patch);
    CacheConfig getConfiguration() const;
    std::string cacheKey(const std::string& language, const std::optional<std::string>& version) const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
    mutable std::shared_mutex cacheMutex;
};

} // namespace cache
} // namespace lingo
