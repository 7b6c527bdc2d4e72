#pragma once

#include <string>
#include "lingo/cache/CachedEntry.hpp"

namespace lingo {
namespace cache {
namespace base {

// Compressor — обратимое преобразование TranslationMap <-> компактная строка.
// Формат: каноничный JSON -> zlib deflate -> base64. Состояния нет.
class Compressor {
public:
    // Бросает std::runtime_error, если zlib отказал
    static std::string compress(const TranslationMap& data);
    // Бросает DecompressionError на любом некорректном входе, включая пустую строку
    static TranslationMap decompress(const std::string& payload);
};

} // namespace base
} // namespace cache
} // namespace lingo
