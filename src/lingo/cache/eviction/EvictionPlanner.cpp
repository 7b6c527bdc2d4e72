#include "lingo/cache/eviction/EvictionPlanner.hpp"
#include <algorithm>

namespace lingo {
namespace cache {
namespace eviction {

std::vector<std::string> EvictionPlanner::plan(size_t bytesToFree, std::vector<EvictionCandidate> candidates) const {
    std::vector<std::string> victims;
    if (bytesToFree == 0) {
        return victims;
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const EvictionCandidate& a, const EvictionCandidate& b) {
            return a.timestamp < b.timestamp;
        });
    size_t freed = 0;
    for (auto& candidate : candidates) {
        if (freed >= bytesToFree) {
            break;
        }
        freed += candidate.size;
        victims.push_back(std::move(candidate.key));
    }
    return victims;
}

} // namespace eviction
} // namespace cache
} // namespace lingo
