#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <cstdint>
#include <core/credential_store.hpp>
#include <core/types.hpp>
#include <platform/file_lock.hpp>

namespace fs = std::filesystem;

struct DatabaseInfo {
    uintmax_t size = 0;
    int64_t last_modified = 0;      // seconds since epoch
};

// The on-disk database. The path is resolved once per invocation and passed
// in, so tests can point it at a temporary directory.
//
// Layout next to the database (default ~/.crab/credentials.json):
//   credentials_<unixtime>.json.bak   backups, never pruned
//   credentials.json.lock             advisory lock for writers
//   credentials.json.tmp              in-flight save, renamed over the target
class CredentialFile {
public:
    explicit CredentialFile(fs::path path);

    // <home>/.crab/credentials.json. Fails with PathResolution when the
    // home directory cannot be determined.
    static Result<fs::path> resolve_default_path();

    // True iff the database file exists. Filesystem errors count as "no".
    bool exists() const;

    // Missing file -> empty store (not an error). Unreadable -> Io.
    // Unparseable -> Deserialization; never silently empty.
    Result<CredentialStore> load() const;

    // Create parent directories, serialize, write a 0600 temporary file and
    // rename it over the database.
    Result<void> save(const CredentialStore& store) const;

    // Copy the database to <stem>_<unixtime><ext>.bak beside it and return
    // that path. DatabaseNotFound if there is nothing to back up.
    Result<fs::path> backup() const;

    // Delete the database file. DatabaseNotFound if it does not exist.
    Result<void> remove() const;

    Result<DatabaseInfo> metadata() const;

    // Existing backups of this database, oldest first.
    std::vector<fs::path> list_backups() const;

    // Take the writer lock. Locked if another process holds it, Io if the
    // lock file cannot be created. The lock is released when the returned
    // object is destroyed.
    Result<std::unique_ptr<FileLock>> lock() const;

    const fs::path& path() const { return path_; }

private:
    fs::path backup_path_for(int64_t timestamp, int attempt) const;

    fs::path path_;
};
