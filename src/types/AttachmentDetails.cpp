#include "types/AttachmentDetails.hpp"

#include <nlohmann/json.hpp>

namespace lb::types {

void to_json(nlohmann::json& j, const AttachmentDetails& d) {
    j = {
        {"id", d.id},
        {"vaultID", d.vaultID},
        {"name", d.name},
        {"filename", d.filename.string()},
        {"size", d.size},
        {"mime", d.mime ? nlohmann::json(*d.mime) : nlohmann::json(nullptr)}
    };
}

}
