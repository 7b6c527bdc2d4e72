#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "lingo/cache/CachedEntry.hpp"

namespace lingo {
namespace cache {
namespace base {

// Каноничная компактная JSON-форма. Некорректный UTF-8 заменяется на U+FFFD, исключений нет
std::string canonicalJson(const nlohmann::json& value);

// SizeEstimator — размер payload в байтах его каноничной JSON-формы
class SizeEstimator {
public:
    static size_t sizeOf(const TranslationMap& data);
    // Строка меряется как JSON-литерал, кавычки включены
    static size_t sizeOf(const std::string& payload);
    static size_t sizeOf(const nlohmann::json& payload);
};

} // namespace base
} // namespace cache
} // namespace lingo
