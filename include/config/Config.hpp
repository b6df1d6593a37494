#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace lb::config {

// Argon2id cost presets, mapped onto libsodium's crypto_pwhash limits
enum class KdfStrength { Min, Interactive, Moderate, Sensitive };

std::string to_string(KdfStrength s);
KdfStrength kdfStrengthFromString(const std::string& s);

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum lockbox      = spdlog::level::info;   // Startup, CLI commands
    spdlog::level::level_enum datasource   = spdlog::level::warn;   // Load/save and attachment failures
    spdlog::level::level_enum crypto       = spdlog::level::warn;   // Surface failure to encrypt/decrypt
    spdlog::level::level_enum storage      = spdlog::level::warn;   // Underlying I/O issues
    spdlog::level::level_enum credentials  = spdlog::level::warn;   // Unknown or expired handles
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/lockbox";
    LogLevelsConfig levels;
};

struct CryptoConfig {
    KdfStrength kdf_strength = KdfStrength::Interactive;
};

struct StorageConfig {
    bool atomic_writes = false; // write to a sibling temp file, then rename over the target
};

struct Config {
    LoggingConfig logging;
    CryptoConfig crypto;
    StorageConfig storage;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const CryptoConfig& c);
void from_json(const nlohmann::json& j, CryptoConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);

} // namespace lb::config
