#pragma once

#include "credentials/Credentials.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lb::credentials {

// Process-wide resolver from credentials id to credentials data.
class Channel {
public:
    static void add(const std::string& id, const std::shared_ptr<const CredentialsData>& data);

    // Throws std::invalid_argument for unknown or expired ids
    [[nodiscard]] static std::shared_ptr<const CredentialsData> get(const std::string& id);

    [[nodiscard]] static bool contains(const std::string& id);

    // Number of live entries, expired ones are pruned first
    [[nodiscard]] static size_t size();

private:
    static void prune_();

    static inline std::mutex mutex_;
    static inline std::unordered_map<std::string, std::weak_ptr<const CredentialsData>> entries_;
};

}
