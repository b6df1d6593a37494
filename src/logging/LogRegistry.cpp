#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace lb::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto& cnf = config::ConfigRegistry::get().logging;

    // console
    const auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(cnf.levels.console_log_level);
    console->set_color_mode(spdlog::color_mode::automatic);
    console->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    const auto mainFile = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (logDir / MAIN_LOG_FILE).string(), MAIN_MAX_BYTES, MAIN_MAX_FILES);
    mainFile->set_level(cnf.levels.file_log_level);
    mainFile->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console, mainFile});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("lockbox",     sub_levels.lockbox);
    makeLogger("datasource",  sub_levels.datasource);
    makeLogger("crypto",      sub_levels.crypto);
    makeLogger("storage",     sub_levels.storage);
    makeLogger("credentials", sub_levels.credentials);

    // audit: file-only sink (append)
    {
        const auto auditFile = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (logDir / AUDIT_LOG_FILE).string(), /*truncate=*/false);
        auditFile->set_pattern(LOG_FORMAT);
        std::vector<spdlog::sink_ptr> sinks = { auditFile };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    lockbox()->debug("[LogRegistry] Initialized in {}", logDir.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
