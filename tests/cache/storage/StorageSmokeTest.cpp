#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include "lingo/cache/storage/FileStorage.hpp"
#include "lingo/cache/storage/MemoryStorage.hpp"

using namespace lingo::cache::storage;

namespace {

std::filesystem::path makeTempDir(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("lingo_cache_" + name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(dir);
    return dir;
}

} // namespace

void testMemoryStorageBasicOperations() {
    std::cout << "Testing MemoryStorage basic operations...\n";

    MemoryStorage storage;
    assert(storage.length() == 0);
    assert(!storage.get("a"));
    assert(!storage.key(0));

    storage.set("b", "2");
    storage.set("a", "1");
    storage.set("c", "3");
    assert(storage.length() == 3);
    // Порядок вставки
    assert(*storage.key(0) == "b");
    assert(*storage.key(1) == "a");
    assert(*storage.key(2) == "c");

    storage.set("a", "11");
    assert(*storage.get("a") == "11");
    assert(*storage.key(1) == "a");

    storage.remove("a");
    storage.remove("a");
    assert(storage.length() == 2);
    assert(!storage.get("a"));
    assert(storage.usedBytes() == 4);

    std::cout << "[OK] MemoryStorage basic operations test\n";
}

void testMemoryStorageQuota() {
    std::cout << "Testing MemoryStorage quota...\n";

    MemoryStorage storage(10);
    storage.set("k1", "12345");
    bool thrown = false;
    try {
        storage.set("k2", "12345");
    } catch (const StorageQuotaError&) {
        thrown = true;
    }
    assert(thrown);
    assert(storage.length() == 1);
    assert(!storage.get("k2"));

    // Перезапись того же ключа учитывает освобождаемое место
    storage.set("k1", "12345678");
    assert(*storage.get("k1") == "12345678");

    std::cout << "[OK] MemoryStorage quota test\n";
}

void testKeysWithPrefix() {
    std::cout << "Testing keysWithPrefix...\n";

    MemoryStorage storage;
    storage.set("translation_cache_de", "x");
    storage.set("user_settings", "y");
    storage.set("translation_cache_en", "z");
    auto keys = keysWithPrefix(storage, "translation_cache_");
    assert(keys.size() == 2);
    assert(keys[0] == "translation_cache_de");
    assert(keys[1] == "translation_cache_en");
    assert(keysWithPrefix(storage, "none_").empty());

    std::cout << "[OK] keysWithPrefix test\n";
}

void testFileStorageFileNames() {
    std::cout << "Testing FileStorage file name encoding...\n";

    assert(FileStorage::encodeFileName("translation_cache_de_v1.0.0") == "translation_cache_de_v1.0.0.entry");
    assert(FileStorage::encodeFileName("a/b c") == "a%2Fb%20c.entry");
    assert(*FileStorage::decodeFileName("a%2Fb%20c.entry") == "a/b c");
    assert(!FileStorage::decodeFileName("readme.txt"));
    assert(!FileStorage::decodeFileName("bad%2.entry"));

    std::cout << "[OK] FileStorage file name encoding test\n";
}

void testFileStoragePersistence() {
    std::cout << "Testing FileStorage persistence...\n";

    auto dir = makeTempDir("storage");
    {
        FileStorage storage(dir);
        assert(storage.length() == 0);
        storage.set("translation_cache_en", "{\"a\":1}");
        storage.set("translation_cache_de", "{\"b\":2}");
        storage.set("other/key", "value");
        assert(storage.length() == 3);
        // Индекс отсортирован
        assert(*storage.key(0) == "other/key");
        assert(*storage.key(1) == "translation_cache_de");
        storage.remove("other/key");
        storage.remove("other/key");
    }
    {
        FileStorage reopened(dir);
        assert(reopened.length() == 2);
        assert(*reopened.get("translation_cache_en") == "{\"a\":1}");
        assert(*reopened.get("translation_cache_de") == "{\"b\":2}");
        assert(!reopened.get("other/key"));
    }
    std::filesystem::remove_all(dir);

    std::cout << "[OK] FileStorage persistence test\n";
}

int main() {
    try {
        testMemoryStorageBasicOperations();
        testMemoryStorageQuota();
        testKeysWithPrefix();
        testFileStorageFileNames();
        testFileStoragePersistence();
        std::cout << "All Storage tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
