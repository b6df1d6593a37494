#pragma once

#include "credentials/Credentials.hpp"
#include "datasource/ContentCache.hpp"
#include "datasource/ContentCodec.hpp"
#include "types/AttachmentDetails.hpp"
#include "types/Vault.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lb::datasource {

/**
 * Pluggable vault backend. Generic vault code talks to this interface and
 * adapts to a backend through the two capability flags.
 *
 * Attachment operations throw std::logic_error unless overridden by a
 * backend that supports attachments. Encryption of attachment payloads is
 * optional: when no credentials are passed the bytes are stored or returned
 * untouched.
 */
class Datasource {
public:
    Datasource(std::string type, credentials::Credentials credentials, std::shared_ptr<const ContentCodec> codec);
    virtual ~Datasource() = default;

    Datasource(const Datasource&) = delete;
    Datasource& operator=(const Datasource&) = delete;

    [[nodiscard]] const std::string& type() const { return type_; }
    [[nodiscard]] const credentials::Credentials& credentials() const { return credentials_; }

    virtual types::History load(const credentials::Credentials& credentials) = 0;
    virtual void save(const types::History& history, const credentials::Credentials& credentials) = 0;

    virtual types::Buffer getAttachment(const types::VaultID& vaultID,
                                        const types::AttachmentID& attachmentID,
                                        const std::optional<credentials::Credentials>& credentials = std::nullopt);

    virtual types::AttachmentDetails getAttachmentDetails(const types::VaultID& vaultID,
                                                          const types::AttachmentID& attachmentID);

    virtual void putAttachment(const types::VaultID& vaultID,
                               const types::AttachmentID& attachmentID,
                               const types::Buffer& buffer,
                               const std::optional<credentials::Credentials>& credentials = std::nullopt);

    virtual void removeAttachment(const types::VaultID& vaultID, const types::AttachmentID& attachmentID);

    [[nodiscard]] virtual bool supportsAttachments() const { return false; }
    [[nodiscard]] virtual bool supportsRemoteBypass() const { return false; }

    // Inject encrypted content; the next load() decodes it without touching storage
    void setContent(types::EncryptedContent content);
    void clearContent();

    [[nodiscard]] bool hasContent() const { return content_.hasContent(); }
    [[nodiscard]] const ContentState& contentState() const { return content_.state(); }

protected:
    // Decodes the cached content; throws std::logic_error when nothing is cached
    [[nodiscard]] types::History decodeCached(const credentials::Credentials& credentials) const;

    ContentCache content_;
    std::shared_ptr<const ContentCodec> codec_;

private:
    std::string type_;
    credentials::Credentials credentials_;
};

}
