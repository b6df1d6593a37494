#pragma once

#include "types/Vault.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace lb::types {

struct AttachmentDetails {
    AttachmentID id{};
    VaultID vaultID{};
    std::string name{};              // file name, <id>.<ext>
    std::filesystem::path filename{}; // full path
    uintmax_t size{0};
    std::optional<std::string> mime{};  // not tracked by datasources

    [[nodiscard]] bool operator==(const AttachmentDetails& other) const = default;
};

void to_json(nlohmann::json& j, const AttachmentDetails& d);

}
