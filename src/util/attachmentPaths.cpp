#include "util/attachmentPaths.hpp"
#include "crypto/attachments.hpp"

#include <stdexcept>

namespace lb::util {

void validatePathSegment(const std::string_view segment, const std::string_view what) {
    if (segment.empty())
        throw std::invalid_argument(std::string(what) + " must not be empty");
    if (segment == "." || segment == "..")
        throw std::invalid_argument(std::string(what) + " must not be a relative path segment: " + std::string(segment));
    if (segment.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos)
        throw std::invalid_argument(std::string(what) + " contains a path separator or NUL: " + std::string(segment));
}

std::filesystem::path attachmentsDir(const std::filesystem::path& baseDir, const types::VaultID& vaultID) {
    validatePathSegment(vaultID, "Vault ID");
    return baseDir / ATTACHMENTS_ROOT_DIR / vaultID;
}

std::string attachmentFileName(const types::AttachmentID& attachmentID) {
    validatePathSegment(attachmentID, "Attachment ID");
    return attachmentID + "." + std::string(crypto::ATTACHMENT_EXT);
}

std::filesystem::path attachmentPath(const std::filesystem::path& attachmentsDir, const types::AttachmentID& attachmentID) {
    return attachmentsDir / attachmentFileName(attachmentID);
}

}
