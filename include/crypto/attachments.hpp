#pragma once

#include "types/Vault.hpp"

#include <string_view>

namespace lb::credentials {
class Credentials;
}

namespace lb::crypto {

// File extension of every attachment written by a datasource
inline constexpr std::string_view ATTACHMENT_EXT = "bcatt";

// Leading marker of an encrypted attachment, followed by a sealed payload
inline constexpr std::string_view ATTACHMENT_MARKER = "BCAT";

// Throws datasource::EncodeError
types::Buffer encryptAttachment(const types::Buffer& buffer, const credentials::Credentials& credentials);

// Throws datasource::DecodeError on a foreign, truncated or tampered payload or a wrong password
types::Buffer decryptAttachment(const types::Buffer& buffer, const credentials::Credentials& credentials);

}
