#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lb::types {

using VaultID = std::string;
using AttachmentID = std::string;

using Buffer = std::vector<uint8_t>;

// Encrypted, serialized vault body exactly as it is stored
using EncryptedContent = std::string;

// Plaintext vault history, one change entry per line. Never inspected by datasources.
using History = std::vector<std::string>;

}
