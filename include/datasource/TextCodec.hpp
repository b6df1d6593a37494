#pragma once

#include "datasource/ContentCodec.hpp"

#include <string_view>

namespace lb::datasource {

/**
 * Text vault format: SIGNATURE followed by base64 of a sealed CBOR array
 * holding one byte string per history entry. Entries are kept byte-exact,
 * they need not be valid UTF-8.
 */
class TextCodec final : public ContentCodec {
public:
    static constexpr std::string_view SIGNATURE = "b~>buttercup/a";

    [[nodiscard]] types::EncryptedContent encode(const types::History& history,
                                                 const credentials::Credentials& credentials) const override;

    [[nodiscard]] types::History decode(const types::EncryptedContent& content,
                                        const credentials::Credentials& credentials) const override;

    [[nodiscard]] static bool hasSignature(std::string_view content);
};

}
