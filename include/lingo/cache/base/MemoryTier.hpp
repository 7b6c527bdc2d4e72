#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include "lingo/cache/CachedEntry.hpp"

namespace lingo {
namespace cache {
namespace base {

// MemoryTier — процессный уровень кэша. Хранит только распакованные записи.
// Своей политики вытеснения нет, удаления решает менеджер.
class MemoryTier {
public:
    const CachedEntry* find(const std::string& key) const; // nullptr, если нет
    void set(const std::string& key, CachedEntry entry);   // Бросает std::invalid_argument для compressed
    bool remove(const std::string& key);
    void clear();
    bool contains(const std::string& key) const;
    size_t size() const;
private:
    std::unordered_map<std::string, CachedEntry> entries_;
};

} // namespace base
} // namespace cache
} // namespace lingo
