#include "lingo/cache/base/Compressor.hpp"
#include "lingo/cache/base/SizeEstimator.hpp"
#include "lingo/cache/CacheErrors.hpp"
#include <zlib.h>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace lingo {
namespace cache {
namespace base {

namespace {

const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string encodeBase64(const std::vector<uint8_t>& bytes) {
    std::string encoded;
    encoded.reserve((bytes.size() + 2) / 3 * 4);
    uint32_t val = 0;
    int valb = -6;
    for (uint8_t c : bytes) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(BASE64_CHARS[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) encoded.push_back(BASE64_CHARS[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4) encoded.push_back('=');
    return encoded;
}

// Строгий разбор: недопустимый символ, длина или паддинг дают DecompressionError
std::vector<uint8_t> decodeBase64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        throw DecompressionError("Compressor: некорректная длина base64: " + std::to_string(text.size()));
    }
    std::array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(BASE64_CHARS[i])] = i;
    }
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;

    std::vector<uint8_t> decoded;
    decoded.reserve(text.size() / 4 * 3);
    uint32_t val = 0;
    int valb = -8;
    for (size_t i = 0; i < text.size() - padding; ++i) {
        int digit = table[static_cast<unsigned char>(text[i])];
        if (digit < 0) {
            throw DecompressionError("Compressor: недопустимый символ base64 в позиции " + std::to_string(i));
        }
        val = (val << 6) + static_cast<uint32_t>(digit);
        valb += 6;
        if (valb >= 0) {
            decoded.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return decoded;
}

std::vector<uint8_t> deflateBytes(const std::string& input) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::vector<uint8_t> output(bound);
    int rc = compress2(output.data(), &bound,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        throw std::runtime_error("Compressor: compress2 завершился с кодом " + std::to_string(rc));
    }
    output.resize(bound);
    return output;
}

std::string inflateBytes(const std::vector<uint8_t>& input) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        throw DecompressionError("Compressor: inflateInit не удался");
    }
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    std::string output;
    std::array<char, 16384> chunk;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string reason = stream.msg ? stream.msg : "код " + std::to_string(rc);
            inflateEnd(&stream);
            throw DecompressionError("Compressor: ошибка inflate: " + reason);
        }
        output.append(chunk.data(), chunk.size() - stream.avail_out);
        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            // Вход закончился раньше конца потока
            inflateEnd(&stream);
            throw DecompressionError("Compressor: усечённый поток deflate");
        }
    }
    inflateEnd(&stream);
    return output;
}

} // namespace

std::string Compressor::compress(const TranslationMap& data) {
    return encodeBase64(deflateBytes(canonicalJson(nlohmann::json(data))));
}

TranslationMap Compressor::decompress(const std::string& payload) {
    if (payload.empty()) {
        throw DecompressionError("Compressor: пустой сжатый payload");
    }
    const std::string json = inflateBytes(decodeBase64(payload));
    auto parsed = nlohmann::json::parse(json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw DecompressionError("Compressor: распакованные данные не являются JSON-объектом");
    }
    TranslationMap result;
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        if (!it.value().is_string()) {
            throw DecompressionError("Compressor: значение для ключа '" + it.key() + "' не строка");
        }
        result.emplace(it.key(), it.value().get<std::string>());
    }
    return result;
}

} // namespace base
} // namespace cache
} // namespace lingo
