#include "lingo/cache/base/MemoryTier.hpp"
#include <stdexcept>

namespace lingo {
namespace cache {
namespace base {

const CachedEntry* MemoryTier::find(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

void MemoryTier::set(const std::string& key, CachedEntry entry) {
    if (entry.metadata.compressed) {
        throw std::invalid_argument("MemoryTier: сжатая запись не может попасть в память: " + key);
    }
    entries_[key] = std::move(entry);
}

bool MemoryTier::remove(const std::string& key) {
    return entries_.erase(key) > 0;
}

void MemoryTier::clear() {
    entries_.clear();
}

bool MemoryTier::contains(const std::string& key) const {
    return entries_.count(key) > 0;
}

size_t MemoryTier::size() const {
    return entries_.size();
}

} // namespace base
} // namespace cache
} // namespace lingo
