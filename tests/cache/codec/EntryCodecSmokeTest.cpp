#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "lingo/cache/CacheConfig.hpp"
#include "lingo/cache/CacheErrors.hpp"
#include "lingo/cache/base/SizeEstimator.hpp"
#include "lingo/cache/codec/EntryCodec.hpp"

using namespace lingo::cache;

namespace {

TranslationMap makeBundle(size_t entries) {
    TranslationMap data;
    for (size_t i = 0; i < entries; ++i) {
        data["key" + std::to_string(i)] = "value" + std::to_string(i);
    }
    return data;
}

EntryMetadata makeMetadata() {
    EntryMetadata metadata;
    metadata.language = "de";
    metadata.version = "1.0.0";
    metadata.timestamp = 1700000000000;
    metadata.coverage = 0.95;
    return metadata;
}

template <typename Error>
bool decodeThrows(const codec::EntryCodec& codec, const std::string& blob) {
    try {
        codec.decode("k", blob);
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

void testEncodeUncompressed() {
    std::cout << "Testing EntryCodec uncompressed encoding...\n";

    codec::EntryCodec codec;
    CacheConfig config;
    TranslationMap data{{"hello", "Hallo"}, {"world", "Welt"}};
    auto encoded = codec.encode(data, makeMetadata(), config);

    assert(!encoded.metadata.compressed);
    assert(!encoded.metadata.originalSize);
    assert(!encoded.compressionRatio);
    assert(encoded.metadata.size == base::SizeEstimator::sizeOf(data));
    assert(encoded.metadata.checksum && encoded.metadata.checksum->size() == 64);

    auto record = nlohmann::json::parse(encoded.blob);
    assert(record["data"]["hello"] == "Hallo");
    assert(record["metadata"]["language"] == "de");
    assert(record["metadata"]["version"] == "1.0.0");
    assert(record["metadata"]["timestamp"] == 1700000000000);
    assert(record["metadata"]["compressed"] == false);
    assert(!record["metadata"].contains("originalSize"));

    auto decoded = codec.decode("translation_cache_de_v1.0.0", encoded.blob);
    assert(decoded.key == "translation_cache_de_v1.0.0");
    assert(decoded.data == data);
    assert(decoded.metadata.coverage == 0.95);
    assert(*decoded.metadata.version == "1.0.0");

    std::cout << "[OK] EntryCodec uncompressed encoding test\n";
}

void testEncodeCompressed() {
    std::cout << "Testing EntryCodec compressed encoding...\n";

    codec::EntryCodec codec;
    CacheConfig config;
    config.compressionThreshold = 1024;
    auto data = makeBundle(120);
    assert(base::SizeEstimator::sizeOf(data) > 2048);

    auto encoded = codec.encode(data, makeMetadata(), config);
    assert(encoded.metadata.compressed);
    assert(encoded.metadata.originalSize);
    assert(*encoded.metadata.originalSize == base::SizeEstimator::sizeOf(data));
    assert(encoded.metadata.size < *encoded.metadata.originalSize);
    assert(encoded.compressionRatio && *encoded.compressionRatio < 1.0);

    auto record = nlohmann::json::parse(encoded.blob);
    assert(record["data"].is_string());
    assert(record["metadata"]["compressed"] == true);
    assert(record["metadata"]["size"] == encoded.metadata.size);

    auto decoded = codec.decode("k", encoded.blob);
    assert(!decoded.metadata.compressed);
    assert(decoded.data == data);

    auto metadata = codec.decodeMetadata(encoded.blob);
    assert(metadata.compressed);
    assert(metadata.timestamp == 1700000000000);

    // Отключённое сжатие
    config.enableCompression = false;
    auto plain = codec.encode(data, makeMetadata(), config);
    assert(!plain.metadata.compressed);
    assert(!plain.metadata.originalSize);

    std::cout << "[OK] EntryCodec compressed encoding test\n";
}

void testDecodeRejectsCorruption() {
    std::cout << "Testing EntryCodec corruption detection...\n";

    codec::EntryCodec codec;
    CacheConfig config;
    config.compressionThreshold = 100;

    assert(decodeThrows<CorruptEntryError>(codec, "{not json"));
    assert(decodeThrows<CorruptEntryError>(codec, "[]"));
    assert(decodeThrows<CorruptEntryError>(codec, "{\"data\":{}}"));
    assert(decodeThrows<CorruptEntryError>(codec,
        "{\"data\":{},\"metadata\":{\"language\":\"de\",\"compressed\":false,\"size\":2}}"));

    // Подмена data без обновления контрольной суммы
    auto encoded = codec.encode(TranslationMap{{"hello", "Hallo"}}, makeMetadata(), config);
    auto record = nlohmann::json::parse(encoded.blob);
    record["data"]["hello"] = "Servus";
    assert(decodeThrows<CorruptEntryError>(codec, record.dump()));

    // Без контрольной суммы запись принимается
    record["metadata"].erase("checksum");
    assert(codec.decode("k", record.dump()).data.at("hello") == "Servus");

    // Битый сжатый payload
    auto packed = codec.encode(makeBundle(60), makeMetadata(), config);
    auto packedRecord = nlohmann::json::parse(packed.blob);
    assert(packedRecord["metadata"]["compressed"] == true);
    packedRecord["data"] = "AAAA";
    packedRecord["metadata"].erase("checksum");
    assert(decodeThrows<DecompressionError>(codec, packedRecord.dump()));

    std::cout << "[OK] EntryCodec corruption detection test\n";
}

void testDecodeRejectsOutOfRangeTimestamp() {
    std::cout << "Testing EntryCodec timestamp range...\n";

    codec::EntryCodec codec;
    const std::string head = "{\"data\":{},\"metadata\":{\"language\":\"it\",\"compressed\":false,\"size\":2,\"timestamp\":";
    assert(decodeThrows<CorruptEntryError>(codec, head + "-9223372036854775808}}"));
    assert(decodeThrows<CorruptEntryError>(codec, head + "-1}}"));
    assert(decodeThrows<CorruptEntryError>(codec, head + "18446744073709551615}}"));
    bool thrown = false;
    try {
        codec.decodeMetadata(head + "-9223372036854775808}}");
    } catch (const CorruptEntryError&) {
        thrown = true;
    }
    assert(thrown);

    assert(codec.decodeMetadata(head + "0}}").timestamp == 0);
    assert(codec.decodeMetadata(head + "9223372036854775807}}").timestamp == INT64_MAX);

    std::cout << "[OK] EntryCodec timestamp range test\n";
}

void testEncodeNormalizesInvalidUtf8() {
    std::cout << "Testing EntryCodec invalid UTF-8...\n";

    codec::EntryCodec codec;
    CacheConfig config;
    const TranslationMap data = {{"k", "\xff\xfe"}, {"ok", "fine"}};
    auto encoded = codec.encode(data, makeMetadata(), config);

    // encode() отдаёт ровно то, что потом вернёт decode()
    auto decoded = codec.decode("k", encoded.blob);
    assert(decoded.data == encoded.data);
    assert(encoded.data.at("k") != "\xff\xfe");
    assert(encoded.data.at("ok") == "fine");
    assert(encoded.metadata.size == base::SizeEstimator::sizeOf(encoded.data));

    std::cout << "[OK] EntryCodec invalid UTF-8 test\n";
}

int main() {
    try {
        testEncodeUncompressed();
        testEncodeCompressed();
        testDecodeRejectsCorruption();
        testDecodeRejectsOutOfRangeTimestamp();
        testEncodeNormalizesInvalidUtf8();
        std::cout << "All EntryCodec tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
