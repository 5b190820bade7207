#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from $CRAB_CONFIG, or ~/.crab/config.yaml. A missing file yields
    // the defaults; a file that exists but does not parse is a Config error.
    static Result<Config> load();

    // Load from an explicit path (same missing-file rule).
    static Result<Config> load_file(const fs::path& path);

    // Parse config text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Database file to operate on: the `database` override if set, otherwise
    // ~/.crab/credentials.json. Fails with PathResolution if the home
    // directory is needed and cannot be found.
    Result<fs::path> database_path() const;

    // Accessors
    const std::optional<std::string>& database_override() const { return database_; }
    bool backup_before_delete() const { return backup_before_delete_; }
    bool confirm() const { return confirm_; }
    bool debug_log() const { return debug_log_; }

public:
    Config() = default;

private:
    std::optional<std::string> database_;
    bool backup_before_delete_ = true;
    bool confirm_ = true;
    bool debug_log_ = false;
};

// Get paths. Both fail with PathResolution when the home directory is unknown.
Result<fs::path> get_global_config_dir();
Result<fs::path> get_global_config_path();

// <home>/.crab/credentials.json
Result<fs::path> get_default_database_path();
