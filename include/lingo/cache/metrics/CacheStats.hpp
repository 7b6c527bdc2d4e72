#pragma once

#include <atomic>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace lingo {
namespace cache {
namespace metrics {

// CacheStats — снимок статистики кэша
struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    double hitRate = 0.0;           // hits / (hits + misses), 0 без обращений
    size_t evictions = 0;
    double compressionRatio = 0.0;  // Последний наблюдённый, не среднее
    size_t totalSize = 0;           // Байт на долговременном уровне
    size_t itemCount = 0;           // Ключей на долговременном уровне
    size_t memoryItems = 0;         // Записей в памяти
    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"hitRate", hitRate},
            {"evictions", evictions},
            {"compressionRatio", compressionRatio},
            {"totalSize", totalSize},
            {"itemCount", itemCount},
            {"memoryItems", memoryItems}
        };
    }
};

// StatsCollector — счётчики попаданий, промахов, вытеснений и коэффициент сжатия.
// Размеры уровней сюда не входят: они считаются по запросу в snapshot().
class StatsCollector {
public:
    void recordHit() { hits_.fetch_add(1, std::memory_order_relaxed); }
    void recordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void recordEviction() { evictions_.fetch_add(1, std::memory_order_relaxed); }
    // Перезаписывает значение, а не усредняет
    void recordCompressionRatio(double ratio) { compressionRatio_.store(ratio, std::memory_order_relaxed); }
    CacheStats snapshot(size_t totalSize, size_t itemCount, size_t memoryItems) const;
private:
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> evictions_{0};
    std::atomic<double> compressionRatio_{0.0};
};

} // namespace metrics
} // namespace cache
} // namespace lingo
