#include "lingo/cache/storage/FileStorage.hpp"
#include "lingo/cache/logging/CacheLogger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace lingo {
namespace cache {
namespace storage {

namespace {
constexpr const char* ENTRY_EXTENSION = ".entry";
constexpr const char* TEMP_EXTENSION = ".tmp";

bool isSafeChar(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '-';
}
} // namespace

FileStorage::FileStorage(const std::filesystem::path& directory) : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec || !std::filesystem::is_directory(directory_)) {
        throw StorageIoError("FileStorage: не удалось создать каталог '" + directory_.string() + "': " + ec.message());
    }
    loadIndex();
    logging::get()->debug("FileStorage: открыт каталог '{}', ключей: {}", directory_.string(), index_.size());
}

std::string FileStorage::encodeFileName(const std::string& key) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : key) {
        if (isSafeChar(c)) {
            ss << static_cast<char>(c);
        } else {
            ss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    ss << ENTRY_EXTENSION;
    return ss.str();
}

std::optional<std::string> FileStorage::decodeFileName(const std::string& fileName) {
    const std::string extension = ENTRY_EXTENSION;
    if (fileName.size() <= extension.size() ||
        fileName.compare(fileName.size() - extension.size(), extension.size(), extension) != 0) {
        return std::nullopt;
    }
    const std::string encoded = fileName.substr(0, fileName.size() - extension.size());
    std::string key;
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            key.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size() ||
            !std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
            return std::nullopt;
        }
        key.push_back(static_cast<char>(std::stoi(encoded.substr(i + 1, 2), nullptr, 16)));
        i += 2;
    }
    return key;
}

std::filesystem::path FileStorage::pathFor(const std::string& key) const {
    return directory_ / encodeFileName(key);
}

void FileStorage::loadIndex() {
    std::error_code ec;
    for (const auto& item : std::filesystem::directory_iterator(directory_, ec)) {
        if (!item.is_regular_file()) continue;
        auto key = decodeFileName(item.path().filename().string());
        if (key) {
            index_.push_back(*key);
        }
    }
    if (ec) {
        throw StorageIoError("FileStorage: не удалось прочитать каталог '" + directory_.string() + "': " + ec.message());
    }
    std::sort(index_.begin(), index_.end());
}

std::optional<std::string> FileStorage::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!std::binary_search(index_.begin(), index_.end(), key)) {
        return std::nullopt;
    }
    std::ifstream file(pathFor(key), std::ios::binary);
    if (!file) {
        logging::get()->warn("FileStorage: ключ '{}' есть в индексе, но файл не открывается", key);
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void FileStorage::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto target = pathFor(key);
    auto temp = target;
    temp += TEMP_EXTENSION;
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StorageIoError("FileStorage: не удалось открыть '" + temp.string() + "' для записи");
        }
        file.write(value.data(), static_cast<std::streamsize>(value.size()));
        file.flush();
        if (!file) {
            throw StorageIoError("FileStorage: ошибка записи '" + temp.string() + "'");
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw StorageIoError("FileStorage: не удалось переименовать '" + temp.string() + "': " + ec.message());
    }
    auto pos = std::lower_bound(index_.begin(), index_.end(), key);
    if (pos == index_.end() || *pos != key) {
        index_.insert(pos, key);
    }
}

void FileStorage::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(pathFor(key), ec);
    if (ec) {
        throw StorageIoError("FileStorage: не удалось удалить ключ '" + key + "': " + ec.message());
    }
    auto pos = std::lower_bound(index_.begin(), index_.end(), key);
    if (pos != index_.end() && *pos == key) {
        index_.erase(pos);
    }
}

std::optional<std::string> FileStorage::key(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= index_.size()) {
        return std::nullopt;
    }
    return index_[index];
}

size_t FileStorage::length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace storage
} // namespace cache
} // namespace lingo
