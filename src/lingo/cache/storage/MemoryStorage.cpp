#include "lingo/cache/storage/MemoryStorage.hpp"
#include <algorithm>

namespace lingo {
namespace cache {
namespace storage {

MemoryStorage::MemoryStorage(size_t quotaBytes) : quotaBytes_(quotaBytes) {}

std::optional<std::string> MemoryStorage::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStorage::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    size_t released = it == values_.end() ? 0 : key.size() + it->second.size();
    size_t required = key.size() + value.size();
    if (quotaBytes_ > 0 && usedBytes_ - released + required > quotaBytes_) {
        throw StorageQuotaError("MemoryStorage: превышена квота " + std::to_string(quotaBytes_) +
                                " байт при записи ключа '" + key + "'");
    }
    if (it == values_.end()) {
        order_.push_back(key);
        values_.emplace(key, value);
    } else {
        it->second = value;
    }
    usedBytes_ = usedBytes_ - released + required;
}

void MemoryStorage::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return;
    }
    usedBytes_ -= key.size() + it->second.size();
    values_.erase(it);
    order_.erase(std::find(order_.begin(), order_.end(), key));
}

std::optional<std::string> MemoryStorage::key(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= order_.size()) {
        return std::nullopt;
    }
    return order_[index];
}

size_t MemoryStorage::length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

size_t MemoryStorage::usedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return usedBytes_;
}

} // namespace storage
} // namespace cache
} // namespace lingo
