#include "lingo/cache/storage/StorageAdapter.hpp"

namespace lingo {
namespace cache {
namespace storage {

std::vector<std::string> keysWithPrefix(const StorageAdapter& storage, const std::string& prefix) {
    std::vector<std::string> keys;
    const size_t count = storage.length();
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto key = storage.key(i);
        if (key && key->compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(*key);
        }
    }
    return keys;
}

} // namespace storage
} // namespace cache
} // namespace lingo
