#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace lb::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> lockbox()     { return get("lockbox"); }
    static std::shared_ptr<spdlog::logger> datasource()  { return get("datasource"); }
    static std::shared_ptr<spdlog::logger> crypto()      { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> storage()     { return get("storage"); }
    static std::shared_ptr<spdlog::logger> credentials() { return get("credentials"); }
    static std::shared_ptr<spdlog::logger> audit()       { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

    static constexpr auto MAIN_LOG_FILE = "lockbox.log";
    static constexpr auto AUDIT_LOG_FILE = "audit.log";

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static constexpr size_t MAIN_MAX_BYTES = 10 * 1024 * 1024; // 10 MiB
    static constexpr size_t MAIN_MAX_FILES = 5;
};

}
