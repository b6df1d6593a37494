#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace lb::config {

class ConfigRegistry {
public:
    // First call wins; later calls are ignored
    static void init(const std::filesystem::path& path);
    static void init(const Config& config);

    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace lb::config
