#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace lingo {
namespace cache {

// Ключ перевода -> переведённая строка. std::map даёт каноничный порядок при сериализации
using TranslationMap = std::map<std::string, std::string>;

// EntryMetadata — метаданные записи (язык, версия, время записи, размеры)
struct EntryMetadata {
    std::string language;                   // Код языка
    std::optional<std::string> version;     // Версия бандла
    int64_t timestamp = 0;                  // Время записи, мс с эпохи (и TTL, и порядок вытеснения)
    double coverage = 0.0;                  // Полнота бандла, кэш её не интерпретирует
    bool compressed = false;                // true только в долговременном представлении
    size_t size = 0;                        // Размер хранимого data (сжатого, если compressed)
    std::optional<size_t> originalSize;     // Исходный размер, если была попытка сжатия
    std::optional<std::string> checksum;    // SHA-256 хранимого data (hex)
};

// CachedEntry — запись кэша: ключ, данные, метаданные
struct CachedEntry {
    std::string key;
    TranslationMap data;
    EntryMetadata metadata;
};

// BundleMetadata — то, что передаёт вызывающий при set()
struct BundleMetadata {
    std::string language;
    std::optional<std::string> version;
    double coverage = 0.0;
};

// TranslationBundle — результат fetch-функции при preload()
struct TranslationBundle {
    TranslationMap data;
    BundleMetadata metadata;
};

} // namespace cache
} // namespace lingo
