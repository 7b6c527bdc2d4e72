#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "lingo/cache/CacheConfig.hpp"
#include "lingo/cache/CachedEntry.hpp"

namespace lingo {
namespace cache {
namespace codec {

// EncodedEntry — результат encode(): строка для хранилища и метаданные сохранённого представления
struct EncodedEntry {
    std::string blob;
    TranslationMap data;    // Данные в том виде, в каком их вернёт decode()
    EntryMetadata metadata;
    std::optional<double> compressionRatio; // compressedSize / originalSize, если сжатие выполнялось
};

// EntryCodec — (де)сериализация записи в формат хранилища.
// Формат: {"data": <объект | сжатая строка>, "metadata": {...}}
class EntryCodec {
public:
    // language/version/timestamp/coverage берутся из metadata, остальное заполняет кодек.
    // Сбой сжатия не фатален: запись сохраняется без сжатия.
    EncodedEntry encode(const TranslationMap& data, const EntryMetadata& metadata,
                        const CacheConfig& config) const;
    // Возвращает распакованную запись (compressed == false).
    // CorruptEntryError при ошибке разбора или контрольной суммы, DecompressionError при битом сжатом data.
    CachedEntry decode(const std::string& key, const std::string& blob) const;
    // Только метаданные, без распаковки. Бросает CorruptEntryError
    EntryMetadata decodeMetadata(const std::string& blob) const;

    static std::string checksumOf(const nlohmann::json& storedData);
private:
    static nlohmann::json parseRecord(const std::string& blob);
    static EntryMetadata parseMetadata(const nlohmann::json& record);
};

} // namespace codec
} // namespace cache
} // namespace lingo
