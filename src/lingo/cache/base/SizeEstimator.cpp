#include "lingo/cache/base/SizeEstimator.hpp"

namespace lingo {
namespace cache {
namespace base {

std::string canonicalJson(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

size_t SizeEstimator::sizeOf(const TranslationMap& data) {
    return canonicalJson(nlohmann::json(data)).size();
}

size_t SizeEstimator::sizeOf(const std::string& payload) {
    return canonicalJson(nlohmann::json(payload)).size();
}

size_t SizeEstimator::sizeOf(const nlohmann::json& payload) {
    return canonicalJson(payload).size();
}

} // namespace base
} // namespace cache
} // namespace lingo
