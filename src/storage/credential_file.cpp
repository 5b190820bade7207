#include "credential_file.hpp"
#include "database_codec.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

static Result<void> io_error(const std::string& what, const fs::path& p,
                             const std::error_code& ec) {
    return Result<void>::Err(ErrorKind::Io,
                             fmt::format("{} {}: {}", what, p.string(), ec.message()));
}

CredentialFile::CredentialFile(fs::path path) : path_(std::move(path)) {}

Result<fs::path> CredentialFile::resolve_default_path() {
    return get_default_database_path();
}

bool CredentialFile::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

Result<CredentialStore> CredentialFile::load() const {
    std::error_code ec;
    bool present = fs::exists(path_, ec);
    if (ec) {
        return Result<CredentialStore>::Err(io_error("Failed to inspect", path_, ec));
    }
    if (!present) {
        crab_log(fmt::format("load: {} absent, starting empty", path_.string()));
        return Result<CredentialStore>::Ok(CredentialStore{});
    }
    if (!fs::is_regular_file(path_, ec)) {
        return Result<CredentialStore>::Err(
            ErrorKind::Io, fmt::format("Failed to read {}: not a regular file", path_.string()));
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return Result<CredentialStore>::Err(
            ErrorKind::Io, fmt::format("Failed to open {}: {}", path_.string(), std::strerror(errno)));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Result<CredentialStore>::Err(ErrorKind::Io, "Failed to read " + path_.string());
    }

    auto store = deserialize_store(buf.str());
    if (store.is_err()) {
        crab_log_failure("load " + path_.string(), store);
        return store;
    }
    crab_log(fmt::format("load: {} entries (version {}) from {}",
                         store.value.size(), store.value.version(), path_.string()));
    return store;
}

Result<void> CredentialFile::save(const CredentialStore& store) const {
    auto text = serialize_store(store);
    if (text.is_err()) {
        crab_log_failure("save", text);
        return Result<void>::Err(text);
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) return io_error("Failed to create directory", path_.parent_path(), ec);
    }

    fs::path tmp = path_;
    tmp += TEMP_EXTENSION;

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err(
                ErrorKind::Io, fmt::format("Failed to open {}: {}", tmp.string(), std::strerror(errno)));
        }
        // Restrict before any secret hits the disk.
        if (!platform::restrict_to_owner(tmp)) {
            crab_log("save: could not restrict permissions on " + tmp.string());
        }
        out << text.value;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorKind::Io, "Failed to write " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        auto err = io_error("Failed to replace", path_, ec);
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return err;
    }

    crab_log(fmt::format("save: {} entries to {}", store.size(), path_.string()));
    return Result<void>::Ok();
}

fs::path CredentialFile::backup_path_for(int64_t timestamp, int attempt) const {
    std::string name = path_.stem().string() + "_" + std::to_string(timestamp);
    if (attempt > 0) {
        name += "_" + std::to_string(attempt);
    }
    name += path_.extension().string() + BACKUP_EXTENSION;
    return path_.parent_path() / name;
}

Result<fs::path> CredentialFile::backup() const {
    if (!exists()) {
        return Result<fs::path>::Err(ErrorKind::DatabaseNotFound, DATABASE_NOT_FOUND_MSG);
    }

    int64_t timestamp = unix_now();
    for (int attempt = 0; attempt < MAX_BACKUP_COLLISIONS; ++attempt) {
        fs::path target = backup_path_for(timestamp, attempt);

        std::error_code ec;
        if (fs::exists(target, ec)) continue;

        // copy_options::none refuses to overwrite, so a backup taken by a
        // concurrent process in the same second is never clobbered.
        fs::copy_file(path_, target, fs::copy_options::none, ec);
        if (ec == std::errc::file_exists) continue;
        if (ec) return Result<fs::path>::Err(io_error("Failed to back up to", target, ec));

        if (!platform::restrict_to_owner(target)) {
            crab_log("backup: could not restrict permissions on " + target.string());
        }
        crab_log("backup: " + target.string());
        return Result<fs::path>::Ok(target);
    }

    return Result<fs::path>::Err(
        ErrorKind::Io, fmt::format("Too many backups of {} in one second", path_.string()));
}

Result<void> CredentialFile::remove() const {
    if (!exists()) {
        return Result<void>::Err(ErrorKind::DatabaseNotFound, DATABASE_NOT_FOUND_MSG);
    }

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) return io_error("Failed to delete", path_, ec);

    crab_log("delete: " + path_.string());
    return Result<void>::Ok();
}

Result<DatabaseInfo> CredentialFile::metadata() const {
    DatabaseInfo info;
    std::error_code ec;

    info.size = fs::file_size(path_, ec);
    if (ec) return Result<DatabaseInfo>::Err(io_error("Failed to stat", path_, ec));

    auto ftime = fs::last_write_time(path_, ec);
    if (ec) return Result<DatabaseInfo>::Err(io_error("Failed to stat", path_, ec));

    // file_time_type has no portable epoch in C++17; shift it onto system_clock.
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    info.last_modified = std::chrono::duration_cast<std::chrono::seconds>(
        sys.time_since_epoch()).count();

    return Result<DatabaseInfo>::Ok(info);
}

// Parse "<stem>_<ts>[_<n>]<ext>.bak" back into (ts, n). False for other files.
static bool parse_backup_name(const std::string& name, const std::string& prefix,
                              const std::string& suffix, std::pair<int64_t, int64_t>& key) {
    if (name.size() <= prefix.size() + suffix.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    std::string middle = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    auto sep = middle.find('_');
    std::string ts = middle.substr(0, sep);
    std::string n = sep == std::string::npos ? "0" : middle.substr(sep + 1);

    auto all_digits = [](const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
    };
    if (!all_digits(ts) || !all_digits(n)) return false;

    try {
        key = {std::stoll(ts), std::stoll(n)};
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

std::vector<fs::path> CredentialFile::list_backups() const {
    std::vector<std::pair<std::pair<int64_t, int64_t>, fs::path>> found;
    std::string prefix = path_.stem().string() + "_";
    std::string suffix = path_.extension().string() + BACKUP_EXTENSION;

    fs::path dir = path_.has_parent_path() ? path_.parent_path() : fs::path(".");
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return {};

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        std::pair<int64_t, int64_t> key;
        if (parse_backup_name(it->path().filename().string(), prefix, suffix, key)) {
            found.emplace_back(key, it->path());
        }
    }

    std::sort(found.begin(), found.end());
    std::vector<fs::path> backups;
    for (auto& f : found) backups.push_back(std::move(f.second));
    return backups;
}

Result<std::unique_ptr<FileLock>> CredentialFile::lock() const {
    fs::path lock_path = path_;
    lock_path += LOCK_EXTENSION;

    auto lock = std::make_unique<FileLock>(lock_path.string());
    if (!lock->held()) {
        if (lock->open_error() != 0) {
            return Result<std::unique_ptr<FileLock>>::Err(
                ErrorKind::Io, fmt::format("Failed to open lock file {}: {}", lock_path.string(),
                                           std::strerror(lock->open_error())));
        }
        return Result<std::unique_ptr<FileLock>>::Err(
            ErrorKind::Locked, "Another crab process is modifying " + path_.string());
    }
    return Result<std::unique_ptr<FileLock>>::Ok(std::move(lock));
}
