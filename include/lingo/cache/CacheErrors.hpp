#pragma once

#include <stdexcept>
#include <string>

namespace lingo {
namespace cache {

// CacheError — базовый класс ошибок кэша переводов
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// DecompressionError — сжатый payload повреждён; для вызывающего эквивалентно промаху
class DecompressionError : public CacheError {
public:
    explicit DecompressionError(const std::string& message) : CacheError(message) {}
};

// CorruptEntryError — запись в хранилище не разбирается или не совпала контрольная сумма
class CorruptEntryError : public CacheError {
public:
    explicit CorruptEntryError(const std::string& message) : CacheError(message) {}
};

// CacheWriteError — хранилище отказало в записи. Единственная ошибка, которую видит caller set()
class CacheWriteError : public CacheError {
public:
    explicit CacheWriteError(const std::string& message) : CacheError(message) {}
};

} // namespace cache
} // namespace lingo
