#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "lingo/cache/CacheConfig.hpp"
#include "lingo/cache/base/MemoryTier.hpp"
#include "lingo/cache/codec/EntryCodec.hpp"
#include "lingo/cache/eviction/EvictionPlanner.hpp"
#include "lingo/cache/storage/StorageAdapter.hpp"

namespace lingo {
namespace cache {
namespace integrity {

// IntegrityReport — классификация записей долговременного уровня
struct IntegrityReport {
    size_t valid = 0;
    size_t corrupted = 0;
    size_t expired = 0;
    size_t total = 0;
    nlohmann::json toJson() const {
        return {
            {"valid", valid},
            {"corrupted", corrupted},
            {"expired", expired},
            {"total", total}
        };
    }
};

// IntegrityScanner — обход долговременного уровня по префиксу ключей
class IntegrityScanner {
public:
    IntegrityScanner(storage::StorageAdapter& storage, base::MemoryTier& memory, const codec::EntryCodec& codec);
    // Ничего не меняет
    IntegrityReport scan(const CacheConfig& config, int64_t now) const;
    // Удаляет просроченные и повреждённые записи с обоих уровней, возвращает их число
    size_t cleanupExpired(const CacheConfig& config, int64_t now);
    // Кандидаты для вытеснения; повреждённые записи идут с timestamp 0 и размером blob
    std::vector<eviction::EvictionCandidate> inventory(const CacheConfig& config) const;
private:
    static bool isExpired(const EntryMetadata& metadata, const CacheConfig& config, int64_t now);
    storage::StorageAdapter& storage_;
    base::MemoryTier& memory_;
    const codec::EntryCodec& codec_;
};

} // namespace integrity
} // namespace cache
} // namespace lingo
