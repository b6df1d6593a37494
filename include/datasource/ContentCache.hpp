#pragma once

#include "types/Vault.hpp"

#include <variant>

namespace lb::datasource {

struct Unloaded {};

// Supplied by the caller, the backing store was never read
struct CachedForBypass {
    types::EncryptedContent content;
};

struct CachedFromRead {
    types::EncryptedContent content;
};

using ContentState = std::variant<Unloaded, CachedForBypass, CachedFromRead>;

// Loaded-content state of a datasource. Once content is cached, load() never reads storage again.
class ContentCache {
public:
    void setContent(types::EncryptedContent content);
    void cacheRead(types::EncryptedContent content);
    void clear();

    [[nodiscard]] bool hasContent() const;
    [[nodiscard]] bool isBypass() const;

    // Throws std::logic_error when nothing is cached
    [[nodiscard]] const types::EncryptedContent& content() const;

    [[nodiscard]] const ContentState& state() const { return state_; }

private:
    ContentState state_{Unloaded{}};
};

}
