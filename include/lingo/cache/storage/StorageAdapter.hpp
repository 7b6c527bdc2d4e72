#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lingo {
namespace cache {
namespace storage {

// StorageError — отказ хранилища (квота, ввод-вывод)
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

class StorageQuotaError : public StorageError {
public:
    explicit StorageQuotaError(const std::string& message) : StorageError(message) {}
};

class StorageIoError : public StorageError {
public:
    explicit StorageIoError(const std::string& message) : StorageError(message) {}
};

// StorageAdapter — синхронное key/value хранилище, долговременный уровень кэша.
// Предоставляется хостом. Перечисление ключей идёт через key(index)/length().
class StorageAdapter {
public:
    virtual ~StorageAdapter() = default;
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void set(const std::string& key, const std::string& value) = 0; // Может бросить StorageError
    virtual void remove(const std::string& key) = 0; // Отсутствующий ключ не ошибка
    virtual std::optional<std::string> key(size_t index) const = 0;
    virtual size_t length() const = 0;
};

// Все ключи с заданным префиксом, в порядке перечисления хранилища
std::vector<std::string> keysWithPrefix(const StorageAdapter& storage, const std::string& prefix);

} // namespace storage
} // namespace cache
} // namespace lingo
