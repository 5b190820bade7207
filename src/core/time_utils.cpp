#include "time_utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>

int64_t unix_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

std::string format_local_time(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    struct tm tm_buf = {};
#ifdef _WIN32
    bool ok = localtime_s(&tm_buf, &t) == 0;
#else
    bool ok = localtime_r(&t, &tm_buf) != nullptr;
#endif
    if (!ok) {
        return fmt::format("Invalid timestamp: {}", timestamp);
    }

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf) == 0) {
        return fmt::format("Invalid timestamp: {}", timestamp);
    }
    return std::string(buf);
}

std::string format_age(int64_t since, int64_t now) {
    int64_t seconds = now - since;
    if (seconds < 0) seconds = 0;

    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (days > 0) {
        return fmt::format("{}d{}h", days, hours);
    } else if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
