#pragma once

#include "types/Vault.hpp"

namespace lb::credentials {
class Credentials;
}

namespace lb::datasource {

// Converts vault history to and from its encrypted, serialized form.
class ContentCodec {
public:
    virtual ~ContentCodec() = default;

    // Throws EncodeError
    [[nodiscard]] virtual types::EncryptedContent encode(const types::History& history,
                                                         const credentials::Credentials& credentials) const = 0;

    // Throws DecodeError
    [[nodiscard]] virtual types::History decode(const types::EncryptedContent& content,
                                                const credentials::Credentials& credentials) const = 0;
};

}
