#include "lingo/cache/integrity/IntegrityScanner.hpp"
#include "lingo/cache/CacheErrors.hpp"
#include "lingo/cache/logging/CacheLogger.hpp"

namespace lingo {
namespace cache {
namespace integrity {

bool IntegrityScanner::isExpired(const EntryMetadata& metadata, const CacheConfig& config, int64_t now) {
    return metadata.timestamp < now - config.maxAge.count();
}

IntegrityScanner::IntegrityScanner(storage::StorageAdapter& storage, base::MemoryTier& memory,
                                   const codec::EntryCodec& codec)
    : storage_(storage), memory_(memory), codec_(codec) {}

IntegrityReport IntegrityScanner::scan(const CacheConfig& config, int64_t now) const {
    IntegrityReport report;
    const auto keys = storage::keysWithPrefix(storage_, config.storagePrefix);
    report.total = keys.size();
    for (const auto& key : keys) {
        auto blob = storage_.get(key);
        if (!blob) continue;
        try {
            const auto metadata = codec_.decodeMetadata(*blob);
            if (isExpired(metadata, config, now)) {
                ++report.expired;
                continue;
            }
            codec_.decode(key, *blob);
            ++report.valid;
        } catch (const CacheError& e) {
            logging::get()->debug("IntegrityScanner: запись '{}' повреждена: {}", key, e.what());
            ++report.corrupted;
        }
    }
    logging::get()->debug("IntegrityScanner: valid={}, expired={}, corrupted={}, total={}",
                          report.valid, report.expired, report.corrupted, report.total);
    return report;
}

size_t IntegrityScanner::cleanupExpired(const CacheConfig& config, int64_t now) {
    size_t removed = 0;
    for (const auto& key : storage::keysWithPrefix(storage_, config.storagePrefix)) {
        auto blob = storage_.get(key);
        if (!blob) continue;
        bool drop = false;
        try {
            const auto metadata = codec_.decodeMetadata(*blob);
            drop = isExpired(metadata, config, now);
            if (!drop) {
                // Полный разбор: контрольная сумма и сжатый data
                codec_.decode(key, *blob);
            }
        } catch (const CacheError& e) {
            logging::get()->warn("IntegrityScanner: удаляется повреждённая запись '{}': {}", key, e.what());
            drop = true;
        }
        if (drop) {
            storage_.remove(key);
            memory_.remove(key);
            ++removed;
        }
    }
    if (removed > 0) {
        logging::get()->info("IntegrityScanner: удалено просроченных/повреждённых записей: {}", removed);
    }
    return removed;
}

std::vector<eviction::EvictionCandidate> IntegrityScanner::inventory(const CacheConfig& config) const {
    std::vector<eviction::EvictionCandidate> candidates;
    for (const auto& key : storage::keysWithPrefix(storage_, config.storagePrefix)) {
        auto blob = storage_.get(key);
        if (!blob) continue;
        try {
            const auto entry = codec_.decode(key, *blob);
            candidates.push_back({key, entry.metadata.timestamp, entry.metadata.size});
        } catch (const CacheError&) {
            candidates.push_back({key, 0, blob->size()});
        }
    }
    return candidates;
}

} // namespace integrity
} // namespace cache
} // namespace lingo
