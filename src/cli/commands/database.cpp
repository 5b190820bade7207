#include "../base_cli.hpp"
#include "../prompt.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <iostream>
#include <fmt/format.h>

using Args = BaseCLI::Args;

static Result<void> do_info(BaseCLI& cli, const Args& args) {
    if (!args.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Usage: crab info");
    }

    auto ready = cli.require_database();
    if (ready.is_err()) return ready;
    if (!cli.db->exists()) {
        return Result<void>::Err(ErrorKind::DatabaseNotFound, DATABASE_NOT_FOUND_MSG);
    }

    auto loaded = cli.db->load();
    if (loaded.is_err()) return Result<void>::Err(loaded);

    std::cout << theme::section("Database Information");
    std::cout << theme::kv("Version", loaded.value.version());
    std::cout << theme::kv("Entries", std::to_string(loaded.value.size()));

    auto meta = cli.db->metadata();
    if (meta.is_ok()) {
        std::cout << theme::kv("File size", fmt::format("{} bytes", meta.value.size));
        std::cout << theme::kv("Last modified", format_local_time(meta.value.last_modified));
    } else {
        std::cout << theme::warn("Failed to get file info: " + meta.error);
    }

    std::cout << theme::kv("Location", cli.db->path().string());

    auto backups = cli.db->list_backups();
    if (backups.empty()) {
        std::cout << theme::kv("Backups", "none");
    } else {
        std::cout << theme::kv("Backups", fmt::format("{} (latest {})", backups.size(),
                                                      backups.back().filename().string()));
    }
    std::cout << "\n";
    return Result<void>::Ok();
}

static Result<void> do_backup(BaseCLI& cli, const Args& args) {
    if (!args.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Usage: crab backup");
    }

    auto ready = cli.require_database();
    if (ready.is_err()) return ready;

    auto backup = cli.db->backup();
    if (backup.is_err()) return Result<void>::Err(backup);

    std::cout << theme::ok("Database backup created: " + backup.value.string());
    return Result<void>::Ok();
}

static Result<void> do_delete(BaseCLI& cli, const Args& args) {
    if (!args.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Usage: crab delete");
    }

    auto ready = cli.require_database();
    if (ready.is_err()) return ready;
    if (!cli.db->exists()) {
        return Result<void>::Err(ErrorKind::DatabaseNotFound, DATABASE_NOT_FOUND_MSG);
    }
    auto lock = cli.lock_database();
    if (lock.is_err()) return Result<void>::Err(lock);

    std::cout << theme::warn("You are about to delete the entire database!");

    // A database that no longer parses can still be deleted.
    auto loaded = cli.db->load();
    if (loaded.is_ok()) {
        std::cout << theme::info(fmt::format("Current database contains {} entries",
                                             loaded.value.size()));
    } else {
        std::cout << theme::warn("Current database cannot be read: " + loaded.error);
    }

    bool make_backup = cli.config.backup_before_delete();
    if (cli.config.confirm()) {
        auto confirmed = prompt_confirm(
            "Are you sure you want to delete the ENTIRE database? This cannot be undone!");
        if (confirmed.is_err()) return Result<void>::Err(confirmed);
        if (!confirmed.value) {
            std::cout << theme::info("Operation cancelled.");
            return Result<void>::Ok();
        }

        auto want_backup = prompt_confirm("Create a backup before deletion?", make_backup);
        if (want_backup.is_err()) return Result<void>::Err(want_backup);
        make_backup = want_backup.value;
    }

    if (make_backup) {
        auto backup = cli.db->backup();
        if (backup.is_err()) return Result<void>::Err(backup);
        std::cout << theme::ok("Database backup created: " + backup.value.string());
    }

    auto removed = cli.db->remove();
    if (removed.is_err()) return removed;

    std::cout << theme::ok("Database deleted: " + cli.db->path().string());
    return Result<void>::Ok();
}

void register_database_commands(BaseCLI& cli) {
    cli.add_command("info", do_info, "info", "Show database details");
    cli.add_command("backup", do_backup, "backup", "Copy the database to a timestamped backup");
    cli.add_command("delete", do_delete, "delete", "Delete the entire database");
}
