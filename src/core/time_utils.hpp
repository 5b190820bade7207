#pragma once

#include <string>
#include <cstdint>

// Current time as whole seconds since the Unix epoch (UTC).
int64_t unix_now();

// Format a Unix timestamp as local "YYYY-MM-DD HH:MM:SS".
// Returns "Invalid timestamp: <n>" if the value cannot be converted.
std::string format_local_time(int64_t timestamp);

// Format the time elapsed between two Unix timestamps.
// Returns human-readable string like "3d4h", "2h35m", "14m22s", "8s".
// Negative spans (clock skew) are shown as "0s".
std::string format_age(int64_t since, int64_t now);
