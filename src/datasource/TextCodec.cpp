#include "datasource/TextCodec.hpp"
#include "datasource/errors.hpp"
#include "credentials/Credentials.hpp"
#include "crypto/encrypt.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace lb::logging;
using namespace lb::types;

namespace lb::datasource {

bool TextCodec::hasSignature(const std::string_view content) {
    return content.starts_with(SIGNATURE);
}

EncryptedContent TextCodec::encode(const History& history, const credentials::Credentials& credentials) const {
    try {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& line : history)
            entries.push_back(nlohmann::json::binary(Buffer(line.begin(), line.end())));

        const auto sealed = crypto::seal(nlohmann::json::to_cbor(entries), credentials.masterPassword());
        return std::string(SIGNATURE) + crypto::b64_encode(sealed);
    } catch (const std::exception& e) {
        LogRegistry::datasource()->error("[TextCodec] Failed to encode history of {} entries: {}", history.size(), e.what());
        throw EncodeError("Failed to encode vault: " + std::string(e.what()));
    }
}

History TextCodec::decode(const EncryptedContent& content, const credentials::Credentials& credentials) const {
    if (!hasSignature(content)) {
        LogRegistry::datasource()->error("[TextCodec] Content of {} bytes has no vault signature", content.size());
        throw DecodeError("Failed to decode vault: invalid or missing signature");
    }

    try {
        const auto sealed = crypto::b64_decode(content.substr(SIGNATURE.size()));
        const auto plaintext = crypto::unseal(sealed, credentials.masterPassword());

        const auto entries = nlohmann::json::from_cbor(plaintext);
        if (!entries.is_array()) throw std::runtime_error("history is not an array");

        History history;
        history.reserve(entries.size());
        for (const auto& entry : entries) {
            if (!entry.is_binary()) throw std::runtime_error("history entry is not a byte string");
            const auto& bytes = entry.get_binary();
            history.emplace_back(bytes.begin(), bytes.end());
        }
        return history;
    } catch (const std::exception& e) {
        LogRegistry::datasource()->error("[TextCodec] Failed to decode vault content: {}", e.what());
        throw DecodeError("Failed to decode vault: " + std::string(e.what()));
    }
}

}
