#pragma once

#include "datasource/Datasource.hpp"
#include "datasource/TextCodec.hpp"
#include "storage/FileSystem.hpp"
#include "storage/LocalFileSystem.hpp"

#include <filesystem>
#include <memory>

namespace lb::datasource {

/**
 * Vault stored as a single local file, attachments stored beside it:
 *
 *   <baseDir>/<vault-file>
 *   <baseDir>/.buttercup/<vaultID>/<attachmentID>.bcatt
 *
 * The vault path comes from the datasource config of the credentials the
 * instance is constructed with. Every operation opens and releases its file
 * within the call.
 */
class FileDatasource final : public Datasource {
public:
    static constexpr auto TYPE = "file";

    explicit FileDatasource(const credentials::Credentials& credentials,
                            std::shared_ptr<storage::FileSystem> fs = std::make_shared<storage::LocalFileSystem>(),
                            std::shared_ptr<const ContentCodec> codec = std::make_shared<TextCodec>());

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::filesystem::path baseDir() const { return path_.parent_path(); }

    // Reads the vault file unless content is already cached, then decodes the cached content
    types::History load(const credentials::Credentials& credentials) override;

    // Encodes first; nothing is written if encoding fails
    void save(const types::History& history, const credentials::Credentials& credentials) override;

    types::Buffer getAttachment(const types::VaultID& vaultID,
                                const types::AttachmentID& attachmentID,
                                const std::optional<credentials::Credentials>& credentials = std::nullopt) override;

    types::AttachmentDetails getAttachmentDetails(const types::VaultID& vaultID,
                                                  const types::AttachmentID& attachmentID) override;

    void putAttachment(const types::VaultID& vaultID,
                       const types::AttachmentID& attachmentID,
                       const types::Buffer& buffer,
                       const std::optional<credentials::Credentials>& credentials = std::nullopt) override;

    // Removing a missing attachment is a NotFoundError, not a no-op
    void removeAttachment(const types::VaultID& vaultID, const types::AttachmentID& attachmentID) override;

    [[nodiscard]] bool supportsAttachments() const override { return true; }
    [[nodiscard]] bool supportsRemoteBypass() const override { return true; }

private:
    std::filesystem::path path_;
    std::shared_ptr<storage::FileSystem> fs_;

    void ensureAttachmentsPaths(const std::filesystem::path& attachmentsDir) const;
};

}
