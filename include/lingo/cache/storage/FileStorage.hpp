#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "lingo/cache/storage/StorageAdapter.hpp"

namespace lingo {
namespace cache {
namespace storage {

// FileStorage — долговременное хранилище: один файл на ключ в каталоге.
// Индекс ключей читается при создании и поддерживается отсортированным;
// предполагается единственный писатель.
class FileStorage : public StorageAdapter {
public:
    explicit FileStorage(const std::filesystem::path& directory); // Бросает StorageIoError
    std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;
    std::optional<std::string> key(size_t index) const override;
    size_t length() const override;
    const std::filesystem::path& directory() const { return directory_; }

    static std::string encodeFileName(const std::string& key);
    static std::optional<std::string> decodeFileName(const std::string& fileName);
private:
    std::filesystem::path pathFor(const std::string& key) const;
    void loadIndex();
    std::filesystem::path directory_;
    std::vector<std::string> index_; // Отсортированные ключи
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace cache
} // namespace lingo
