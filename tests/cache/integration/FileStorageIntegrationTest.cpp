#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "lingo/cache/manager/TranslationCacheManager.hpp"
#include "lingo/cache/storage/FileStorage.hpp"

using namespace lingo::cache;

void testSurvivesRestart() {
    std::cout << "Testing FileStorage-backed cache restart...\n";

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("lingo_cache_integration_" + std::to_string(stamp));
    std::filesystem::remove_all(dir);

    CacheConfig config;
    config.compressionThreshold = 256;
    config.logPath = (dir / "logs" / "cache.log").string();

    TranslationMap data;
    for (int i = 0; i < 50; ++i) {
        data["menu.item" + std::to_string(i)] = "Menüpunkt " + std::to_string(i);
    }
    BundleMetadata metadata;
    metadata.language = "de";
    metadata.version = "3.1";
    metadata.coverage = 0.75;

    {
        auto storage = std::make_shared<storage::FileStorage>((dir / "store").string());
        TranslationCacheManager cache(storage, config);
        cache.set("de", data, metadata);
        cache.set("en", TranslationMap{{"hello", "Hello"}}, BundleMetadata{"en", std::nullopt, 1.0});
        assert(storage->length() == 2);
    }

    auto storage = std::make_shared<storage::FileStorage>((dir / "store").string());
    assert(storage->length() == 2);
    TranslationCacheManager cache(storage, config);

    auto entry = cache.get("de", std::string("3.1"));
    assert(entry);
    assert(entry->data == data);
    assert(entry->metadata.coverage == 0.75);
    assert(entry->metadata.originalSize);

    auto report = cache.validateIntegrity();
    assert(report.valid == 2);
    assert(report.total == 2);

    cache.clear();
    assert(storage->length() == 0);

    std::filesystem::remove_all(dir);

    std::cout << "[OK] FileStorage-backed cache restart test\n";
}

int main() {
    try {
        testSurvivesRestart();
        std::cout << "All integration tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
