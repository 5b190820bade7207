#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <platform/platform.hpp>
#include "constants.hpp"
#include "types.hpp"
#include <fmt/format.h>

// Debug log for troubleshooting storage problems. Off by default; turned on
// by `debug_log: true` in the config or CRAB_DEBUG=1. Never pass secret
// values to crab_log.

inline bool& crab_log_enabled() {
    static bool enabled = [] {
        const char* env = std::getenv(ENV_DEBUG);
        return env && std::string(env) == "1";
    }();
    return enabled;
}

inline void set_crab_log_enabled(bool enabled) {
    crab_log_enabled() = enabled;
}

inline std::string crab_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILE_NAME).string();
    return path;
}

inline void crab_log(const std::string& msg) {
    if (!crab_log_enabled()) return;

    std::ofstream out(crab_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Log a failed result with its kind, e.g. "load: deserialization: ...".
template <typename T>
inline void crab_log_failure(const std::string& label, const Result<T>& r) {
    if (r.is_ok()) return;
    crab_log(fmt::format("{}: {}: {}", label, error_kind_name(r.kind), r.error));
}
