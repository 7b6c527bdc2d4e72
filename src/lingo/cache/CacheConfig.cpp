#include "lingo/cache/CacheConfig.hpp"
#include <stdexcept>

namespace lingo {
namespace cache {

nlohmann::json CacheConfig::toJson() const {
    return {
        {"maxAge", maxAge.count()},
        {"maxSize", maxSize},
        {"compressionThreshold", compressionThreshold},
        {"enableCompression", enableCompression},
        {"enableVersioning", enableVersioning},
        {"storagePrefix", storagePrefix},
        {"logPath", logPath},
        {"maxLogSize", maxLogSize},
        {"maxLogFiles", maxLogFiles}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    if (!j.is_object()) {
        throw std::invalid_argument("CacheConfig: ожидался JSON-объект");
    }
    CacheConfigPatch::fromJson(j).applyTo(config);
    try {
        config.logPath = j.value("logPath", config.logPath);
        config.maxLogSize = j.value("maxLogSize", config.maxLogSize);
        config.maxLogFiles = j.value("maxLogFiles", config.maxLogFiles);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("CacheConfig: некорректное поле логирования: ") + e.what());
    }
    return config;
}

void CacheConfigPatch::applyTo(CacheConfig& config) const {
    if (maxAge) config.maxAge = *maxAge;
    if (maxSize) config.maxSize = *maxSize;
    if (compressionThreshold) config.compressionThreshold = *compressionThreshold;
    if (enableCompression) config.enableCompression = *enableCompression;
    if (enableVersioning) config.enableVersioning = *enableVersioning;
    if (storagePrefix) config.storagePrefix = *storagePrefix;
}

bool CacheConfigPatch::empty() const {
    return !maxAge && !maxSize && !compressionThreshold && !enableCompression &&
           !enableVersioning && !storagePrefix;
}

CacheConfigPatch CacheConfigPatch::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("CacheConfigPatch: ожидался JSON-объект");
    }
    CacheConfigPatch patch;
    try {
        if (j.contains("maxAge")) patch.maxAge = std::chrono::milliseconds(j.at("maxAge").get<int64_t>());
        if (j.contains("maxSize")) patch.maxSize = j.at("maxSize").get<size_t>();
        if (j.contains("compressionThreshold")) patch.compressionThreshold = j.at("compressionThreshold").get<size_t>();
        if (j.contains("enableCompression")) patch.enableCompression = j.at("enableCompression").get<bool>();
        if (j.contains("enableVersioning")) patch.enableVersioning = j.at("enableVersioning").get<bool>();
        if (j.contains("storagePrefix")) patch.storagePrefix = j.at("storagePrefix").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("CacheConfigPatch: некорректное поле: ") + e.what());
    }
    return patch;
}

} // namespace cache
} // namespace lingo
