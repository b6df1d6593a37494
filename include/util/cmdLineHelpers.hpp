#pragma once

#include <cstdint>
#include <string>
#include <fmt/core.h>

namespace lb::util {

inline std::string human_bytes(const uint64_t b) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    int u = 0;
    auto v = static_cast<double>(b);
    while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
    // show 0 decimals for B/KiB, 1 for others
    if (u <= 1) return fmt::format("{} {}", u == 0 ? b : static_cast<uint64_t>(v), kUnits[u]);
    return fmt::format("{:.1f} {}", v, kUnits[u]);
}

}
