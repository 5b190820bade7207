#include "../base_cli.hpp"
#include "../prompt.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <optional>
#include <fmt/format.h>

using Args = BaseCLI::Args;

static Result<void> usage_error(const std::string& usage) {
    return Result<void>::Err(ErrorKind::InvalidArgument, "Usage: crab " + usage);
}

static Result<void> not_found(const std::string& service) {
    return Result<void>::Err(ErrorKind::CredentialNotFound,
                             "No credential found for '" + service + "'");
}

// Accepts "-s NAME", "--service NAME" and "--service=NAME" (same for account).
static bool parse_add_args(const Args& args, std::optional<std::string>& service,
                           std::optional<std::string>& account) {
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        std::optional<std::string>* target = nullptr;
        std::string value;

        if (a == "-s" || a == "--service") {
            target = &service;
        } else if (a == "-a" || a == "--account") {
            target = &account;
        } else if (a.rfind("--service=", 0) == 0) {
            service = a.substr(10);
            continue;
        } else if (a.rfind("--account=", 0) == 0) {
            account = a.substr(10);
            continue;
        } else {
            return false;
        }

        if (i + 1 >= args.size()) return false;
        *target = args[++i];
    }
    return true;
}

static Result<void> do_add(BaseCLI& cli, const Args& args) {
    std::optional<std::string> service_arg, account_arg;
    if (!parse_add_args(args, service_arg, account_arg)) {
        return usage_error("add [-s|--service NAME] [-a|--account NAME]");
    }

    auto lock = cli.lock_database();
    if (lock.is_err()) return Result<void>::Err(lock);
    auto loaded = cli.db->load();
    if (loaded.is_err()) return Result<void>::Err(loaded);
    CredentialStore& store = loaded.value;

    std::string service;
    if (service_arg && !service_arg->empty()) {
        service = *service_arg;
    } else {
        auto answer = prompt_required("Service name");
        if (answer.is_err()) return Result<void>::Err(answer);
        service = answer.value;
    }

    if (store.find_entry(service)) {
        std::cout << theme::warn("Service '" + service + "' already exists!");
        if (cli.config.confirm()) {
            auto overwrite = prompt_confirm("Do you want to overwrite it?");
            if (overwrite.is_err()) return Result<void>::Err(overwrite);
            if (!overwrite.value) {
                std::cout << theme::info("Operation cancelled.");
                return Result<void>::Ok();
            }
        }
    }

    std::string account;
    if (account_arg && !account_arg->empty()) {
        account = *account_arg;
    } else {
        auto answer = prompt_required("Account name");
        if (answer.is_err()) return Result<void>::Err(answer);
        account = answer.value;
    }

    auto secret = prompt_secret_confirmed("Secret", "Confirm secret");
    if (secret.is_err()) return Result<void>::Err(secret);

    store.upsert_entry(CredentialEntry::create(service, account, secret.value));

    auto saved = cli.db->save(store);
    if (saved.is_err()) return saved;

    std::cout << theme::ok("Credential for '" + service + "' added successfully!");
    return Result<void>::Ok();
}

static Result<void> do_get(BaseCLI& cli, const Args& args) {
    if (args.size() != 1) return usage_error("get <service>");
    const std::string& service = args[0];

    auto ready = cli.require_database();
    if (ready.is_err()) return ready;
    auto loaded = cli.db->load();
    if (loaded.is_err()) return Result<void>::Err(loaded);

    const CredentialEntry* entry = loaded.value.find_entry(service);
    if (!entry) return not_found(service);

    std::cout << theme::section("Credential");
    std::cout << theme::kv("Service", entry->service());
    std::cout << theme::kv("Account", entry->account());
    std::cout << theme::kv("Secret", entry->secret());
    std::cout << theme::kv("Created", format_local_time(entry->created_at()));
    std::cout << theme::kv("Updated", format_local_time(entry->updated_at()));
    std::cout << "\n";
    return Result<void>::Ok();
}

static Result<void> do_list(BaseCLI& cli, const Args& args) {
    if (!args.empty()) return usage_error("list");

    auto ready = cli.require_database();
    if (ready.is_err()) return ready;
    auto loaded = cli.db->load();
    if (loaded.is_err()) return Result<void>::Err(loaded);

    const CredentialStore& store = loaded.value;
    if (store.empty()) {
        return Result<void>::Err(ErrorKind::CredentialsNotStored, "No Credentials Stored yet.");
    }

    std::cout << theme::section(fmt::format("Stored Credentials ({} entries)", store.size()));
    int64_t now = unix_now();
    size_t i = 1;
    for (const auto& entry : store.entries()) {
        std::cout << theme::color::ORANGE << fmt::format("    {:>3}. ", i++) << theme::color::RESET
                  << entry.service()
                  << theme::dim("  updated " + format_age(entry.updated_at(), now) + " ago")
                  << "\n";
    }
    std::cout << "\n";
    return Result<void>::Ok();
}

static Result<void> do_edit(BaseCLI& cli, const Args& args) {
    if (args.size() != 1) return usage_error("edit <service>");
    const std::string& service = args[0];

    auto lock = cli.lock_database();
    if (lock.is_err()) return Result<void>::Err(lock);
    auto loaded = cli.db->load();
    if (loaded.is_err()) return Result<void>::Err(loaded);
    CredentialStore& store = loaded.value;

    const CredentialEntry* current = store.find_entry(service);
    if (!current) return not_found(service);

    std::cout << theme::section("Editing '" + service + "'");
    std::cout << theme::kv("Service", current->service());
    std::cout << theme::kv("Account", current->account());
    std::cout << "\n";

    auto new_service = prompt_line("New service name", current->service());
    if (new_service.is_err()) return Result<void>::Err(new_service);
    auto new_account = prompt_line("New account", current->account());
    if (new_account.is_err()) return Result<void>::Err(new_account);
    auto change_secret = prompt_confirm("Change secret?");
    if (change_secret.is_err()) return Result<void>::Err(change_secret);

    std::optional<std::string> new_secret;
    if (change_secret.value) {
        auto secret = prompt_secret_confirmed("New secret", "Confirm secret");
        if (secret.is_err()) return Result<void>::Err(secret);
        new_secret = secret.value;
    }

    bool changed = new_service.value != current->service() ||
                   new_account.value != current->account() ||
                   (new_secret && *new_secret != current->secret());
    if (!changed) {
        std::cout << theme::info("Nothing changed.");
        return Result<void>::Ok();
    }

    // Only fields that actually differ are touched, so updated_at moves
    // only when something changed.
    auto updated = store.update_entry(service, [&](CredentialEntry& e) {
        if (new_service.value != e.service()) e.update_service(new_service.value);
        if (new_account.value != e.account()) e.update_account(new_account.value);
        if (new_secret && *new_secret != e.secret()) e.update_secret(*new_secret);
    });
    if (updated.is_err()) return Result<void>::Err(updated);

    auto saved = cli.db->save(store);
    if (saved.is_err()) return saved;

    std::cout << theme::ok("Credential updated successfully!");
    return Result<void>::Ok();
}

static Result<void> do_remove(BaseCLI& cli, const Args& args) {
    if (args.size() != 1) return usage_error("remove <service>");
    const std::string& service = args[0];

    auto lock = cli.lock_database();
    if (lock.is_err()) return Result<void>::Err(lock);
    auto loaded = cli.db->load();
    if (loaded.is_err()) return Result<void>::Err(loaded);
    CredentialStore& store = loaded.value;

    if (!store.find_entry(service)) return not_found(service);

    if (cli.config.confirm()) {
        auto confirmed = prompt_confirm("Are you sure you want to remove '" + service + "'?");
        if (confirmed.is_err()) return Result<void>::Err(confirmed);
        if (!confirmed.value) {
            std::cout << theme::info("Operation cancelled.");
            return Result<void>::Ok();
        }
    }

    store.remove_entry(service);
    auto saved = cli.db->save(store);
    if (saved.is_err()) return saved;

    std::cout << theme::ok("Credential for '" + service + "' removed successfully!");
    return Result<void>::Ok();
}

void register_credentials_commands(BaseCLI& cli) {
    cli.add_command("add", do_add, "add [-s NAME] [-a NAME]", "Store a new credential");
    cli.add_command("get", do_get, "get <service>", "Show a stored credential");
    cli.add_command("list", do_list, "list", "List stored services");
    cli.add_command("edit", do_edit, "edit <service>", "Change a stored credential");
    cli.add_command("remove", do_remove, "remove <service>", "Remove a stored credential");
}
