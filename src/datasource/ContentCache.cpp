#include "datasource/ContentCache.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

using namespace lb::types;

namespace lb::datasource {

void ContentCache::setContent(EncryptedContent content) {
    state_ = CachedForBypass{std::move(content)};
}

void ContentCache::cacheRead(EncryptedContent content) {
    state_ = CachedFromRead{std::move(content)};
}

void ContentCache::clear() {
    state_ = Unloaded{};
}

bool ContentCache::hasContent() const {
    return !std::holds_alternative<Unloaded>(state_);
}

bool ContentCache::isBypass() const {
    return std::holds_alternative<CachedForBypass>(state_);
}

const EncryptedContent& ContentCache::content() const {
    const auto* cached = std::visit([](const auto& s) -> const EncryptedContent* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Unloaded>) return nullptr;
        else return &s.content;
    }, state_);

    if (!cached) throw std::logic_error("No content cached");
    return *cached;
}

}
