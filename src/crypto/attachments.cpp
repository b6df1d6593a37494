#include "crypto/attachments.hpp"
#include "crypto/encrypt.hpp"
#include "credentials/Credentials.hpp"
#include "datasource/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace lb::datasource;
using namespace lb::logging;
using namespace lb::types;

namespace lb::crypto {

Buffer encryptAttachment(const Buffer& buffer, const credentials::Credentials& credentials) {
    try {
        const auto sealed = seal(buffer, credentials.masterPassword());

        Buffer out;
        out.reserve(ATTACHMENT_MARKER.size() + sealed.size());
        out.insert(out.end(), ATTACHMENT_MARKER.begin(), ATTACHMENT_MARKER.end());
        out.insert(out.end(), sealed.begin(), sealed.end());
        return out;
    } catch (const std::exception& e) {
        LogRegistry::crypto()->error("[encryptAttachment] Failed to encrypt {} bytes: {}", buffer.size(), e.what());
        throw EncodeError("Failed to encrypt attachment: " + std::string(e.what()));
    }
}

Buffer decryptAttachment(const Buffer& buffer, const credentials::Credentials& credentials) {
    if (buffer.size() < ATTACHMENT_MARKER.size() ||
        !std::equal(ATTACHMENT_MARKER.begin(), ATTACHMENT_MARKER.end(), buffer.begin())) {
        LogRegistry::crypto()->error("[decryptAttachment] Payload of {} bytes is not an encrypted attachment", buffer.size());
        throw DecodeError("Failed to decrypt attachment: not an encrypted attachment");
    }

    try {
        const Buffer sealed(buffer.begin() + static_cast<long>(ATTACHMENT_MARKER.size()), buffer.end());
        return unseal(sealed, credentials.masterPassword());
    } catch (const std::exception& e) {
        LogRegistry::crypto()->error("[decryptAttachment] Failed to decrypt {} bytes: {}", buffer.size(), e.what());
        throw DecodeError("Failed to decrypt attachment: " + std::string(e.what()));
    }
}

}
