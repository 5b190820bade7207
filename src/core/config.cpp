#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

Result<fs::path> get_global_config_dir() {
    auto home = platform::home_dir();
    if (!home) {
        return Result<fs::path>::Err(ErrorKind::PathResolution, "Home directory not found");
    }
    return Result<fs::path>::Ok(*home / CRAB_DIR_NAME);
}

Result<fs::path> get_global_config_path() {
    const char* env = std::getenv(ENV_CONFIG_PATH);
    if (env && *env) {
        return Result<fs::path>::Ok(fs::path(env));
    }
    auto dir = get_global_config_dir();
    if (dir.is_err()) return Result<fs::path>::Err(dir);
    return Result<fs::path>::Ok(dir.value / CONFIG_FILE_NAME);
}

Result<fs::path> get_default_database_path() {
    auto dir = get_global_config_dir();
    if (dir.is_err()) return Result<fs::path>::Err(dir);
    return Result<fs::path>::Ok(dir.value / DATABASE_FILE_NAME);
}

// Read an optional boolean key; a present key with a non-boolean value is an error.
static bool read_bool(const YAML::Node& root, const char* key, bool fallback) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) return fallback;
    if (!node.IsScalar()) {
        throw YAML::Exception(node.Mark(), fmt::format("'{}' must be true or false", key));
    }
    return node.as<bool>();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config cfg;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(cfg);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Config, "Config must be a mapping of keys to values");
        }

        if (root["database"] && !root["database"].IsNull()) {
            if (!root["database"].IsScalar()) {
                return Result<Config>::Err(ErrorKind::Config, "'database' must be a path");
            }
            std::string db = root["database"].as<std::string>();
            if (!db.empty()) cfg.database_ = db;
        }

        cfg.backup_before_delete_ = read_bool(root, "backup_before_delete", true);
        cfg.confirm_ = read_bool(root, "confirm", true);
        cfg.debug_log_ = read_bool(root, "debug_log", false);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config, std::string("Invalid config: ") + e.what());
    }
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::Config,
                                   "Failed to read config file " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

Result<Config> Config::load() {
    auto path = get_global_config_path();
    if (path.is_err()) {
        // No home directory: nothing to read. Storage will report the
        // PathResolution failure when it needs the default database path.
        return Result<Config>::Ok(Config{});
    }
    auto cfg = load_file(path.value);
    if (cfg.is_ok()) {
        crab_log(fmt::format("config: {} (database override: {})", path.value.string(),
                             cfg.value.database_ ? *cfg.value.database_ : "none"));
    }
    return cfg;
}

Result<fs::path> Config::database_path() const {
    if (database_) {
        auto expanded = platform::expand_user(*database_);
        if (!expanded) {
            return Result<fs::path>::Err(ErrorKind::PathResolution,
                                         "Home directory not found while expanding '" + *database_ + "'");
        }
        return Result<fs::path>::Ok(*expanded);
    }
    return get_default_database_path();
}
