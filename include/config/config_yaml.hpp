#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lb::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["lockbox"]     = to_std_string(spdlog::level::to_string_view(rhs.lockbox));
        node["datasource"]  = to_std_string(spdlog::level::to_string_view(rhs.datasource));
        node["crypto"]      = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["storage"]     = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["credentials"] = to_std_string(spdlog::level::to_string_view(rhs.credentials));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lockbox = spdlog::level::from_str(node["lockbox"].as<std::string>("info"));
        rhs.datasource = spdlog::level::from_str(node["datasource"].as<std::string>("warn"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.credentials = spdlog::level::from_str(node["credentials"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/lockbox");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

template<>
struct convert<CryptoConfig> {
    static Node encode(const CryptoConfig& rhs) {
        Node node;
        node["kdf_strength"] = lb::config::to_string(rhs.kdf_strength);
        return node;
    }

    static bool decode(const Node& node, CryptoConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kdf_strength = kdfStrengthFromString(node["kdf_strength"].as<std::string>("interactive"));
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["atomic_writes"] = rhs.atomic_writes;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.atomic_writes = node["atomic_writes"].as<bool>(false);
        return true;
    }
};

}
