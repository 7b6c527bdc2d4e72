#include "lingo/cache/metrics/CacheStats.hpp"

namespace lingo {
namespace cache {
namespace metrics {

CacheStats StatsCollector::snapshot(size_t totalSize, size_t itemCount, size_t memoryItems) const {
    CacheStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    const size_t lookups = stats.hits + stats.misses;
    stats.hitRate = lookups > 0 ? static_cast<double>(stats.hits) / static_cast<double>(lookups) : 0.0;
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.compressionRatio = compressionRatio_.load(std::memory_order_relaxed);
    stats.totalSize = totalSize;
    stats.itemCount = itemCount;
    stats.memoryItems = memoryItems;
    return stats;
}

} // namespace metrics
} // namespace cache
} // namespace lingo
