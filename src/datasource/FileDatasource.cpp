#include "datasource/FileDatasource.hpp"
#include "datasource/errors.hpp"
#include "credentials/Channel.hpp"
#include "crypto/attachments.hpp"
#include "logging/LogRegistry.hpp"
#include "util/attachmentPaths.hpp"

#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

using namespace lb::logging;
using namespace lb::types;

namespace lb::datasource {

namespace {

fs::path resolveVaultPath(const credentials::Credentials& credentials) {
    const auto data = credentials::Channel::get(credentials.id());
    if (data->datasource.path.empty()) {
        LogRegistry::datasource()->error("[FileDatasource] Credentials {} carry no datasource path", credentials.id());
        throw std::invalid_argument("File datasource requires a datasource path");
    }
    return data->datasource.path;
}

// Rethrow a codec fault with the location it concerns appended
template<typename Fault>
[[noreturn]] void rethrowAt(const Fault& e, const fs::path& location) {
    throw Fault(std::string(e.what()) + " [" + location.string() + "]");
}

}

FileDatasource::FileDatasource(const credentials::Credentials& credentials,
                               std::shared_ptr<storage::FileSystem> fs,
                               std::shared_ptr<const ContentCodec> codec)
    : Datasource(TYPE, credentials, std::move(codec)),
      path_(resolveVaultPath(credentials)),
      fs_(std::move(fs)) {
    if (!fs_) throw std::invalid_argument("File datasource requires a filesystem");
    LogRegistry::datasource()->debug("[FileDatasource] Bound to {}", path_.string());
}

History FileDatasource::load(const credentials::Credentials& credentials) {
    if (!content_.hasContent()) {
        try {
            const auto bytes = fs_->readFile(path_);
            content_.cacheRead(EncryptedContent(bytes.begin(), bytes.end()));
        } catch (const DatasourceError& e) {
            LogRegistry::datasource()->error("[FileDatasource] Failed to read vault {}: {}", path_.string(), e.what());
            throw;
        }
    } else {
        LogRegistry::datasource()->debug("[FileDatasource] Using cached content for {}", path_.string());
    }

    try {
        return decodeCached(credentials);
    } catch (const DecodeError& e) {
        rethrowAt(e, path_);
    }
}

void FileDatasource::save(const History& history, const credentials::Credentials& credentials) {
    EncryptedContent encrypted;
    try {
        encrypted = codec_->encode(history, credentials);
    } catch (const EncodeError& e) {
        rethrowAt(e, path_);
    }

    try {
        fs_->writeFile(path_, Buffer(encrypted.begin(), encrypted.end()));
    } catch (const DatasourceError& e) {
        LogRegistry::datasource()->error("[FileDatasource] Failed to write vault {}: {}", path_.string(), e.what());
        throw;
    }

    LogRegistry::datasource()->debug("[FileDatasource] Saved {} history entries to {}", history.size(), path_.string());
}

Buffer FileDatasource::getAttachment(const VaultID& vaultID,
                                     const AttachmentID& attachmentID,
                                     const std::optional<credentials::Credentials>& credentials) {
    const auto dir = util::attachmentsDir(baseDir(), vaultID);
    const auto attachmentPath = util::attachmentPath(dir, attachmentID);
    ensureAttachmentsPaths(dir);

    auto data = fs_->readFile(attachmentPath);
    if (!credentials) return data;

    try {
        return crypto::decryptAttachment(data, *credentials);
    } catch (const DecodeError& e) {
        rethrowAt(e, attachmentPath);
    }
}

AttachmentDetails FileDatasource::getAttachmentDetails(const VaultID& vaultID, const AttachmentID& attachmentID) {
    const auto dir = util::attachmentsDir(baseDir(), vaultID);
    const auto name = util::attachmentFileName(attachmentID);
    const auto attachmentPath = dir / name;
    ensureAttachmentsPaths(dir);

    const auto st = fs_->stat(attachmentPath);

    AttachmentDetails details;
    details.id = attachmentID;
    details.vaultID = vaultID;
    details.name = name;
    details.filename = attachmentPath;
    details.size = st.size;
    return details;
}

void FileDatasource::putAttachment(const VaultID& vaultID,
                                   const AttachmentID& attachmentID,
                                   const Buffer& buffer,
                                   const std::optional<credentials::Credentials>& credentials) {
    const auto dir = util::attachmentsDir(baseDir(), vaultID);
    const auto attachmentPath = util::attachmentPath(dir, attachmentID);
    ensureAttachmentsPaths(dir);

    if (credentials) {
        Buffer encrypted;
        try {
            encrypted = crypto::encryptAttachment(buffer, *credentials);
        } catch (const EncodeError& e) {
            rethrowAt(e, attachmentPath);
        }
        fs_->writeFile(attachmentPath, encrypted);
    } else {
        fs_->writeFile(attachmentPath, buffer);
    }

    LogRegistry::audit()->info("[FileDatasource] Wrote attachment {} of vault {} ({}, {} input bytes)",
                               attachmentID, vaultID, credentials ? "encrypted" : "raw", buffer.size());
}

void FileDatasource::removeAttachment(const VaultID& vaultID, const AttachmentID& attachmentID) {
    const auto dir = util::attachmentsDir(baseDir(), vaultID);
    const auto attachmentPath = util::attachmentPath(dir, attachmentID);
    ensureAttachmentsPaths(dir);

    fs_->remove(attachmentPath);
    LogRegistry::audit()->info("[FileDatasource] Removed attachment {} of vault {}", attachmentID, vaultID);
}

void FileDatasource::ensureAttachmentsPaths(const fs::path& attachmentsDir) const {
    fs_->createDirectories(attachmentsDir);
}

}
