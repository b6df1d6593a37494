#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace lb::config {

std::string to_string(const KdfStrength s) {
    switch (s) {
    case KdfStrength::Min: return "min";
    case KdfStrength::Interactive: return "interactive";
    case KdfStrength::Moderate: return "moderate";
    case KdfStrength::Sensitive: return "sensitive";
    default: throw std::invalid_argument("Invalid KdfStrength");
    }
}

KdfStrength kdfStrengthFromString(const std::string& s) {
    if (s == "min") return KdfStrength::Min;
    if (s == "interactive") return KdfStrength::Interactive;
    if (s == "moderate") return KdfStrength::Moderate;
    if (s == "sensitive") return KdfStrength::Sensitive;
    throw std::invalid_argument("Unknown kdf_strength: " + s);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    const auto section = [&root]<typename T>(const char* name, T& out) {
        const auto node = root[name];
        if (node && !YAML::convert<T>::decode(node, out))
            throw std::invalid_argument(std::string("Config section '") + name + "' must be a map");
    };

    section("logging", cfg.logging);
    section("crypto", cfg.crypto);
    section("storage", cfg.storage);

    return cfg;
}

namespace {

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

spdlog::level::level_enum levelOr(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    return j.contains(key) ? spdlog::level::from_str(j.at(key).get<std::string>()) : def;
}

}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", c.logging},
        {"crypto", c.crypto},
        {"storage", c.storage}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("crypto")) j.at("crypto").get_to(c.crypto);
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string("/var/log/lockbox"));
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelOr(j, "console_log_level", spdlog::level::info);
    c.file_log_level = levelOr(j, "file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"lockbox", levelName(c.lockbox)},
        {"datasource", levelName(c.datasource)},
        {"crypto", levelName(c.crypto)},
        {"storage", levelName(c.storage)},
        {"credentials", levelName(c.credentials)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.lockbox = levelOr(j, "lockbox", spdlog::level::info);
    c.datasource = levelOr(j, "datasource", spdlog::level::warn);
    c.crypto = levelOr(j, "crypto", spdlog::level::warn);
    c.storage = levelOr(j, "storage", spdlog::level::warn);
    c.credentials = levelOr(j, "credentials", spdlog::level::warn);
}

void to_json(nlohmann::json& j, const CryptoConfig& c) {
    j = {{"kdf_strength", to_string(c.kdf_strength)}};
}

void from_json(const nlohmann::json& j, CryptoConfig& c) {
    c.kdf_strength = kdfStrengthFromString(j.value("kdf_strength", std::string("interactive")));
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {{"atomic_writes", c.atomic_writes}};
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    c.atomic_writes = j.value("atomic_writes", false);
}

} // namespace lb::config
