#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lingo {
namespace cache {
namespace eviction {

// EvictionCandidate — запись долговременного уровня в порядке перечисления
struct EvictionCandidate {
    std::string key;
    int64_t timestamp; // Время записи; 0 для неразбираемых записей
    size_t size;
};

// EvictionPlanner — выбор жертв по времени записи (старые первыми).
// Время чтения не учитывается. Равные timestamp идут в порядке перечисления.
class EvictionPlanner {
public:
    std::vector<std::string> plan(size_t bytesToFree, std::vector<EvictionCandidate> candidates) const;
};

} // namespace eviction
} // namespace cache
} // namespace lingo
