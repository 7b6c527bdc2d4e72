#include "lingo/cache/manager/TranslationCacheManager.hpp"
#include "lingo/cache/CacheErrors.hpp"
#include "lingo/cache/base/MemoryTier.hpp"
#include "lingo/cache/codec/EntryCodec.hpp"
#include "lingo/cache/eviction/EvictionPlanner.hpp"
#include "lingo/cache/logging/CacheLogger.hpp"
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace lingo {
namespace cache {

int64_t systemClockMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Реализация PIMPL
struct TranslationCacheManager::Impl {
    CacheConfig config;
    std::shared_ptr<storage::StorageAdapter> storage;
    Clock clock;
    base::MemoryTier memory;
    codec::EntryCodec codec;
    eviction::EvictionPlanner planner;
    integrity::IntegrityScanner scanner;
    metrics::StatsCollector stats;
    std::shared_ptr<spdlog::logger> logger;

    Impl(std::shared_ptr<storage::StorageAdapter> adapter, const CacheConfig& cfg, Clock clk)
        : config(cfg), storage(std::move(adapter)), clock(std::move(clk)),
          scanner(*storage, memory, codec) {}

    std::string keyFor(const std::string& language, const std::optional<std::string>& version) const {
        std::string key = config.storagePrefix + language;
        if (config.enableVersioning && version && !version->empty()) {
            key += "_v" + *version;
        }
        return key;
    }

    bool isFresh(const EntryMetadata& metadata, int64_t now) const {
        return metadata.timestamp > now - config.maxAge.count();
    }

    void removeEverywhere(const std::string& key) {
        storage->remove(key);
        memory.remove(key);
    }

    size_t durableUsage(const std::string& excludedKey) const {
        size_t usage = 0;
        for (const auto& candidate : scanner.inventory(config)) {
            if (candidate.key != excludedKey) usage += candidate.size;
        }
        return usage;
    }

    // Освобождает место под запись размера required на ключе key.
    // Старая версия той же записи в расчёт не входит: она будет перезаписана.
    void ensureSpace(const std::string& key, size_t required) {
        if (required > config.maxSize) {
            throw CacheWriteError("TranslationCacheManager: запись '" + key + "' (" + std::to_string(required) +
                                  " байт) больше бюджета " + std::to_string(config.maxSize) + " байт");
        }
        size_t usage = durableUsage(key);
        if (usage + required <= config.maxSize) {
            return;
        }
        scanner.cleanupExpired(config, clock());
        usage = durableUsage(key);
        if (usage + required <= config.maxSize) {
            return;
        }
        std::vector<eviction::EvictionCandidate> candidates;
        for (auto& candidate : scanner.inventory(config)) {
            if (candidate.key != key) candidates.push_back(std::move(candidate));
        }
        const size_t bytesToFree = usage + required - config.maxSize;
        for (const auto& victim : planner.plan(bytesToFree, std::move(candidates))) {
            removeEverywhere(victim);
            stats.recordEviction();
            logger->debug("Запись вытеснена: key={}", victim);
        }
    }
};

TranslationCacheManager::TranslationCacheManager(std::shared_ptr<storage::StorageAdapter> storage,
                                                 const CacheConfig& config, Clock clock) {
    if (!storage) {
        throw std::invalid_argument("TranslationCacheManager: хранилище не задано");
    }
    if (!config.validate()) {
        throw std::invalid_argument("TranslationCacheManager: некорректная конфигурация кэша");
    }
    if (!clock) {
        clock = systemClockMillis;
    }
    pImpl = std::make_unique<Impl>(std::move(storage), config, std::move(clock));
    pImpl->logger = logging::initialize(config.logPath, config.maxLogSize, config.maxLogFiles);
    pImpl->logger->info("TranslationCacheManager создан: maxAge={} мс, maxSize={}, compressionThreshold={}, prefix='{}'",
                        config.maxAge.count(), config.maxSize, config.compressionThreshold, config.storagePrefix);
}

TranslationCacheManager::~TranslationCacheManager() {
    if (pImpl && pImpl->logger) {
        pImpl->logger->flush();
    }
}

std::string TranslationCacheManager::cacheKey(const std::string& language,
                                              const std::optional<std::string>& version) const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex);
    return pImpl->keyFor(language, version);
}

std::optional<CachedEntry> TranslationCacheManager::get(const std::string& language,
                                                        const std::optional<std::string>& version) {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    auto& impl = *pImpl;
    const std::string key = impl.keyFor(language, version);
    const int64_t now = impl.clock();

    if (const CachedEntry* cached = impl.memory.find(key)) {
        if (impl.isFresh(cached->metadata, now)) {
            impl.stats.recordHit();
            impl.logger->debug("Попадание в память: key={}", key);
            return *cached;
        }
        impl.memory.remove(key);
    }

    auto blob = impl.storage->get(key);
    if (!blob) {
        impl.stats.recordMiss();
        impl.logger->debug("Промах: key={}", key);
        return std::nullopt;
    }

    try {
        const auto metadata = impl.codec.decodeMetadata(*blob);
        if (!impl.isFresh(metadata, now)) {
            impl.removeEverywhere(key);
            impl.stats.recordMiss();
            impl.logger->debug("Запись устарела и удалена: key={}, возраст={} мс", key, now - metadata.timestamp);
            return std::nullopt;
        }
        CachedEntry entry = impl.codec.decode(key, *blob);
        impl.memory.set(key, entry);
        impl.stats.recordHit();
        impl.logger->debug("Попадание в хранилище: key={}, size={}", key, entry.metadata.size);
        return entry;
    } catch (const CacheError& e) {
        impl.logger->warn("Повреждённая запись удалена: key={}: {}", key, e.what());
        impl.removeEverywhere(key);
        impl.stats.recordMiss();
        return std::nullopt;
    }
}

void TranslationCacheManager::set(const std::string& language, const TranslationMap& data,
                                  const BundleMetadata& metadata) {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    auto& impl = *pImpl;
    const std::string key = impl.keyFor(language, metadata.version);

    EntryMetadata entryMetadata;
    entryMetadata.language = metadata.language.empty() ? language : metadata.language;
    entryMetadata.version = metadata.version;
    entryMetadata.coverage = metadata.coverage;
    entryMetadata.timestamp = impl.clock();

    auto encoded = impl.codec.encode(data, entryMetadata, impl.config);
    if (encoded.compressionRatio) {
        impl.stats.recordCompressionRatio(*encoded.compressionRatio);
    }

    try {
        impl.ensureSpace(key, encoded.metadata.size);
        impl.storage->set(key, encoded.blob);
    } catch (const CacheWriteError& e) {
        impl.logger->error("Ошибка записи в кэш: key={}: {}", key, e.what());
        throw;
    } catch (const std::exception& e) {
        impl.logger->error("Хранилище отказало в записи: key={}: {}", key, e.what());
        throw CacheWriteError("TranslationCacheManager: не удалось сохранить '" + key + "': " + e.what());
    }

    CachedEntry memoryCopy;
    memoryCopy.key = key;
    memoryCopy.data = std::move(encoded.data);
    memoryCopy.metadata = encoded.metadata;
    memoryCopy.metadata.compressed = false;
    impl.memory.set(key, std::move(memoryCopy));

    impl.logger->debug("Бандл сохранён: key={}, size={}, compressed={}, entries={}",
                       key, encoded.metadata.size, encoded.metadata.compressed, data.size());
}

void TranslationCacheManager::remove(const std::string& language, const std::optional<std::string>& version) {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    const std::string key = pImpl->keyFor(language, version);
    pImpl->removeEverywhere(key);
    pImpl->logger->debug("Бандл удалён: key={}", key);
}

void TranslationCacheManager::clear() {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    const auto keys = storage::keysWithPrefix(*pImpl->storage, pImpl->config.storagePrefix);
    for (const auto& key : keys) {
        pImpl->storage->remove(key);
    }
    pImpl->memory.clear();
    pImpl->logger->info("Кэш переводов очищен, удалено ключей: {}", keys.size());
}

size_t TranslationCacheManager::clearExpired() {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    return pImpl->scanner.cleanupExpired(pImpl->config, pImpl->clock());
}

PreloadReport TranslationCacheManager::preload(const std::vector<std::string>& languages,
                                               const FetchFunction& fetchFn) {
    PreloadReport report;
    std::vector<std::pair<std::string, std::future<TranslationBundle>>> pending;

    // Все загрузки запускаются до ожидания первой
    for (const auto& language : languages) {
        if (get(language)) {
            ++report.skipped;
            continue;
        }
        try {
            pending.emplace_back(language, fetchFn(language));
        } catch (const std::exception& e) {
            pImpl->logger->warn("Не удалось запустить загрузку переводов для '{}': {}", language, e.what());
            ++report.failed;
        } catch (...) {
            pImpl->logger->warn("Не удалось запустить загрузку переводов для '{}': неизвестная ошибка", language);
            ++report.failed;
        }
    }

    for (auto& [language, future] : pending) {
        if (!future.valid()) {
            pImpl->logger->warn("Загрузка переводов для '{}' вернула пустой future", language);
            ++report.failed;
            continue;
        }
        try {
            TranslationBundle bundle = future.get();
            set(language, bundle.data, bundle.metadata);
            ++report.loaded;
        } catch (const std::exception& e) {
            pImpl->logger->warn("Не удалось предзагрузить переводы для '{}': {}", language, e.what());
            ++report.failed;
        } catch (...) {
            pImpl->logger->warn("Не удалось предзагрузить переводы для '{}': неизвестная ошибка", language);
            ++report.failed;
        }
    }

    pImpl->logger->info("Предзагрузка завершена: loaded={}, skipped={}, failed={}",
                        report.loaded, report.skipped, report.failed);
    return report;
}

metrics::CacheStats TranslationCacheManager::getStats() const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex);
    const auto& impl = *pImpl;
    size_t totalSize = 0;
    for (const auto& candidate : impl.scanner.inventory(impl.config)) {
        totalSize += candidate.size;
    }
    const size_t itemCount = storage::keysWithPrefix(*impl.storage, impl.config.storagePrefix).size();
    return impl.stats.snapshot(totalSize, itemCount, impl.memory.size());
}

integrity::IntegrityReport TranslationCacheManager::validateIntegrity() const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex);
    return pImpl->scanner.scan(pImpl->config, pImpl->clock());
}

void TranslationCacheManager::updateConfig(const CacheConfigPatch& patch) {
    std::unique_lock<std::shared_mutex> lock(cacheMutex);
    CacheConfig merged = pImpl->config;
    patch.applyTo(merged);
    if (!merged.validate()) {
        throw std::invalid_argument("TranslationCacheManager: некорректная конфигурация кэша");
    }
    pImpl->config = merged;
    pImpl->logger->info("Конфигурация кэша обновлена: {}", merged.toJson().dump());
}

CacheConfig TranslationCacheManager::getConfiguration() const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex);
    return pImpl->config;
}

} // namespace cache
} // namespace lingo
