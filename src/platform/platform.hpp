#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory: HOME on Unix (falling back to the
// passwd entry of the current uid), USERPROFILE on Windows.
// Returns nullopt if none of these name a directory.
std::optional<std::filesystem::path> home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Expands a leading "~" or "~/" against home_dir(). Other paths pass through.
std::optional<std::filesystem::path> expand_user(const std::string& path);

// Restrict a file to owner read/write (0600). Returns false on failure.
bool restrict_to_owner(const std::filesystem::path& path);

} // namespace platform
