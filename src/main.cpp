#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "lingo/cache/CacheConfig.hpp"
#include "lingo/cache/CacheErrors.hpp"
#include "lingo/cache/manager/TranslationCacheManager.hpp"
#include "lingo/cache/storage/FileStorage.hpp"

using namespace lingo::cache;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_NOT_FOUND = 2;

void printUsage() {
    std::cerr <<
        "Usage: lingo_cache_cli --storage <dir> [--config <config.json>] <command> [args]\n"
        "Commands:\n"
        "  set <language> <bundle.json> [version] [coverage]\n"
        "  get <language> [version]\n"
        "  remove <language> [version]\n"
        "  clear\n"
        "  clear-expired\n"
        "  stats\n"
        "  validate\n";
}

// Логи CLI идут в stderr, stdout остаётся под JSON
void initializeLogging() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>("lingo_cache_cli", console_sink);
    spdlog::set_default_logger(logger);
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("не удалось открыть файл '" + path + "'");
    }
    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("файл '" + path + "' не является корректным JSON");
    }
    return j;
}

TranslationMap readBundle(const std::string& path) {
    const auto j = readJsonFile(path);
    if (!j.is_object()) {
        throw std::runtime_error("бандл '" + path + "' должен быть JSON-объектом");
    }
    TranslationMap data;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            throw std::runtime_error("значение ключа '" + it.key() + "' в бандле не строка");
        }
        data.emplace(it.key(), it.value().get<std::string>());
    }
    return data;
}

std::optional<std::string> argAt(const std::vector<std::string>& args, size_t index) {
    if (index < args.size()) return args[index];
    return std::nullopt;
}

nlohmann::json entryToJson(const CachedEntry& entry) {
    nlohmann::json meta = {
        {"language", entry.metadata.language},
        {"timestamp", entry.metadata.timestamp},
        {"coverage", entry.metadata.coverage},
        {"size", entry.metadata.size}
    };
    if (entry.metadata.version) meta["version"] = *entry.metadata.version;
    if (entry.metadata.originalSize) meta["originalSize"] = *entry.metadata.originalSize;
    return {{"key", entry.key}, {"data", entry.data}, {"metadata", meta}};
}

int runCommand(TranslationCacheManager& cache, const std::string& command, const std::vector<std::string>& args) {
    if (command == "set") {
        auto language = argAt(args, 0);
        auto bundlePath = argAt(args, 1);
        if (!language || !bundlePath) {
            printUsage();
            return EXIT_USAGE;
        }
        BundleMetadata metadata;
        metadata.language = *language;
        metadata.version = argAt(args, 2);
        if (auto coverage = argAt(args, 3)) {
            metadata.coverage = std::stod(*coverage);
        }
        cache.set(*language, readBundle(*bundlePath), metadata);
        std::cout << nlohmann::json{{"stored", cache.cacheKey(*language, metadata.version)}}.dump() << std::endl;
        return 0;
    }
    if (command == "get") {
        auto language = argAt(args, 0);
        if (!language) {
            printUsage();
            return EXIT_USAGE;
        }
        auto entry = cache.get(*language, argAt(args, 1));
        if (!entry) {
            std::cout << "null" << std::endl;
            return EXIT_NOT_FOUND;
        }
        std::cout << entryToJson(*entry).dump(2) << std::endl;
        return 0;
    }
    if (command == "remove") {
        auto language = argAt(args, 0);
        if (!language) {
            printUsage();
            return EXIT_USAGE;
        }
        cache.remove(*language, argAt(args, 1));
        return 0;
    }
    if (command == "clear") {
        cache.clear();
        return 0;
    }
    if (command == "clear-expired") {
        std::cout << nlohmann::json{{"removed", cache.clearExpired()}}.dump() << std::endl;
        return 0;
    }
    if (command == "stats") {
        std::cout << cache.getStats().toJson().dump(2) << std::endl;
        return 0;
    }
    if (command == "validate") {
        std::cout << cache.validateIntegrity().toJson().dump(2) << std::endl;
        return 0;
    }
    std::cerr << "Неизвестная команда: " << command << std::endl;
    printUsage();
    return EXIT_USAGE;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string storagePath;
    std::string configPath;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--storage" && i + 1 < argc) {
            storagePath = argv[++i];
        } else if (command.empty() && arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }
    if (storagePath.empty() || command.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    try {
        initializeLogging();
        CacheConfig config;
        if (!configPath.empty()) {
            config = CacheConfig::fromJson(readJsonFile(configPath));
        }
        auto storage = std::make_shared<storage::FileStorage>(storagePath);
        TranslationCacheManager cache(storage, config);
        int rc = runCommand(cache, command, args);
        spdlog::shutdown();
        return rc;
    } catch (const CacheWriteError& e) {
        std::cerr << "Ошибка записи в кэш: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return 1;
    }
}
