#include "lingo/cache/codec/EntryCodec.hpp"
#include "lingo/cache/CacheErrors.hpp"
#include "lingo/cache/base/Compressor.hpp"
#include "lingo/cache/base/SizeEstimator.hpp"
#include "lingo/cache/logging/CacheLogger.hpp"
#include <openssl/sha.h>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace lingo {
namespace cache {
namespace codec {

std::string EntryCodec::checksumOf(const nlohmann::json& storedData) {
    const std::string serialized = base::canonicalJson(storedData);
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(serialized.data()), serialized.size(), hash);
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

EncodedEntry EntryCodec::encode(const TranslationMap& data, const EntryMetadata& metadata,
                                const CacheConfig& config) const {
    EncodedEntry result;
    result.metadata = metadata;
    result.metadata.compressed = false;
    result.metadata.originalSize.reset();

    // Данные приводятся к тому виду, в котором их вернёт хранилище:
    // некорректный UTF-8 заменяется на U+FFFD, совпавшие после замены ключи схлопываются
    nlohmann::json storedData = nlohmann::json::parse(base::canonicalJson(nlohmann::json(data)));
    result.data = storedData.get<TranslationMap>();
    const size_t rawSize = base::SizeEstimator::sizeOf(storedData);
    size_t storedSize = rawSize;

    if (config.enableCompression && rawSize > config.compressionThreshold) {
        result.metadata.originalSize = rawSize;
        try {
            std::string packed = base::Compressor::compress(result.data);
            const size_t packedSize = base::SizeEstimator::sizeOf(packed);
            result.compressionRatio = static_cast<double>(packedSize) / static_cast<double>(rawSize);
            if (packedSize < rawSize) {
                storedData = std::move(packed);
                storedSize = packedSize;
                result.metadata.compressed = true;
            } else {
                logging::get()->debug("EntryCodec: сжатие не уменьшило бандл '{}' ({} -> {} байт), хранится без сжатия",
                                      metadata.language, rawSize, packedSize);
            }
        } catch (const std::exception& e) {
            logging::get()->warn("EntryCodec: сжатие бандла '{}' не удалось, хранится без сжатия: {}",
                                 metadata.language, e.what());
        }
    }

    result.metadata.size = storedSize;
    result.metadata.checksum = checksumOf(storedData);

    nlohmann::json meta = {
        {"language", result.metadata.language},
        {"timestamp", result.metadata.timestamp},
        {"coverage", result.metadata.coverage},
        {"compressed", result.metadata.compressed},
        {"size", result.metadata.size},
        {"checksum", *result.metadata.checksum}
    };
    if (result.metadata.version) meta["version"] = *result.metadata.version;
    if (result.metadata.originalSize) meta["originalSize"] = *result.metadata.originalSize;

    nlohmann::json record = {
        {"data", std::move(storedData)},
        {"metadata", std::move(meta)}
    };
    result.blob = base::canonicalJson(record);
    return result;
}

nlohmann::json EntryCodec::parseRecord(const std::string& blob) {
    auto record = nlohmann::json::parse(blob, nullptr, false);
    if (record.is_discarded()) {
        throw CorruptEntryError("EntryCodec: запись не является корректным JSON");
    }
    if (!record.is_object() || !record.contains("data") || !record.contains("metadata") ||
        !record["metadata"].is_object()) {
        throw CorruptEntryError("EntryCodec: в записи нет полей data/metadata");
    }
    return record;
}

EntryMetadata EntryCodec::parseMetadata(const nlohmann::json& record) {
    const auto& meta = record.at("metadata");
    auto require = [&meta](const char* field, bool ok) {
        if (!ok) {
            throw CorruptEntryError(std::string("EntryCodec: некорректное поле metadata.") + field);
        }
    };
    require("language", meta.contains("language") && meta["language"].is_string());
    require("timestamp", meta.contains("timestamp") && meta["timestamp"].is_number_integer());
    // Отрицательное или не влезающее в int64_t время записи считается повреждением
    require("timestamp", meta["timestamp"].is_number_unsigned()
                             ? meta["timestamp"].get<uint64_t>() <= static_cast<uint64_t>(INT64_MAX)
                             : meta["timestamp"].get<int64_t>() >= 0);
    require("compressed", meta.contains("compressed") && meta["compressed"].is_boolean());
    require("size", meta.contains("size") && meta["size"].is_number_unsigned());

    EntryMetadata metadata;
    metadata.language = meta["language"].get<std::string>();
    metadata.timestamp = meta["timestamp"].get<int64_t>();
    metadata.compressed = meta["compressed"].get<bool>();
    metadata.size = meta["size"].get<size_t>();
    if (meta.contains("coverage")) {
        require("coverage", meta["coverage"].is_number());
        metadata.coverage = meta["coverage"].get<double>();
    }
    if (meta.contains("version") && !meta["version"].is_null()) {
        require("version", meta["version"].is_string());
        metadata.version = meta["version"].get<std::string>();
    }
    if (meta.contains("originalSize") && !meta["originalSize"].is_null()) {
        require("originalSize", meta["originalSize"].is_number_unsigned());
        metadata.originalSize = meta["originalSize"].get<size_t>();
    }
    if (meta.contains("checksum") && !meta["checksum"].is_null()) {
        require("checksum", meta["checksum"].is_string());
        metadata.checksum = meta["checksum"].get<std::string>();
    }
    return metadata;
}

EntryMetadata EntryCodec::decodeMetadata(const std::string& blob) const {
    return parseMetadata(parseRecord(blob));
}

CachedEntry EntryCodec::decode(const std::string& key, const std::string& blob) const {
    const auto record = parseRecord(blob);
    CachedEntry entry;
    entry.key = key;
    entry.metadata = parseMetadata(record);
    const auto& storedData = record["data"];

    if (entry.metadata.checksum && *entry.metadata.checksum != checksumOf(storedData)) {
        throw CorruptEntryError("EntryCodec: контрольная сумма не совпала для ключа '" + key + "'");
    }

    if (entry.metadata.compressed) {
        if (!storedData.is_string()) {
            throw CorruptEntryError("EntryCodec: сжатый data должен быть строкой, ключ '" + key + "'");
        }
        entry.data = base::Compressor::decompress(storedData.get<std::string>());
        entry.metadata.compressed = false;
        return entry;
    }

    if (!storedData.is_object()) {
        throw CorruptEntryError("EntryCodec: data должен быть объектом, ключ '" + key + "'");
    }
    for (auto it = storedData.begin(); it != storedData.end(); ++it) {
        if (!it.value().is_string()) {
            throw CorruptEntryError("EntryCodec: значение '" + it.key() + "' не строка, ключ '" + key + "'");
        }
        entry.data.emplace(it.key(), it.value().get<std::string>());
    }
    return entry;
}

} // namespace codec
} // namespace cache
} // namespace lingo
