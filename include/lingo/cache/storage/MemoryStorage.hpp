#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "lingo/cache/storage/StorageAdapter.hpp"

namespace lingo {
namespace cache {
namespace storage {

// MemoryStorage — хранилище в памяти процесса с порядком вставки и опциональной квотой.
// Квота считается как сумма длин ключей и значений, 0 означает без ограничения.
class MemoryStorage : public StorageAdapter {
public:
    explicit MemoryStorage(size_t quotaBytes = 0);
    std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    std::optional<std::string> key(size_t index) const override;
    size_t length() const override;
    size_t usedBytes() const;
private:
    const size_t quotaBytes_;
    size_t usedBytes_ = 0;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace cache
} // namespace lingo
