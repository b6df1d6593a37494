#pragma once

#include "types/Vault.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace lb::util {

// Hidden directory under the vault's base directory that holds per-vault attachment directories
inline constexpr std::string_view ATTACHMENTS_ROOT_DIR = ".buttercup";

// Throws std::invalid_argument for empty ids, "." / "..", or ids containing '/', '\\' or NUL
void validatePathSegment(std::string_view segment, std::string_view what);

// <baseDir>/.buttercup/<vaultID>
[[nodiscard]] std::filesystem::path attachmentsDir(const std::filesystem::path& baseDir, const types::VaultID& vaultID);

// <attachmentID>.<ATTACHMENT_EXT>
[[nodiscard]] std::string attachmentFileName(const types::AttachmentID& attachmentID);

// <attachmentsDir>/<attachmentID>.<ATTACHMENT_EXT>
[[nodiscard]] std::filesystem::path attachmentPath(const std::filesystem::path& attachmentsDir,
                                                   const types::AttachmentID& attachmentID);

}
