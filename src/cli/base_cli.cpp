#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() = default;

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {std::move(handler), usage, help};
}

Result<void> BaseCLI::require_config() {
    if (config_loaded_) return Result<void>::Ok();

    auto config_result = Config::load();
    if (config_result.is_err()) {
        return Result<void>::Err(config_result);
    }
    config = config_result.value;
    if (config.debug_log()) set_crab_log_enabled(true);
    config_loaded_ = true;
    return Result<void>::Ok();
}

Result<void> BaseCLI::require_database() {
    if (db) return Result<void>::Ok();

    auto cfg = require_config();
    if (cfg.is_err()) return cfg;

    auto path = config.database_path();
    if (path.is_err()) {
        return Result<void>::Err(path);
    }
    db.emplace(path.value);
    return Result<void>::Ok();
}

Result<std::unique_ptr<FileLock>> BaseCLI::lock_database() {
    auto ready = require_database();
    if (ready.is_err()) return Result<std::unique_ptr<FileLock>>::Err(ready);
    return db->lock();
}

Result<void> BaseCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Unknown command: " + command);
    }

    crab_log(fmt::format("command: {} ({} args)", command, args.size()));
    auto result = it->second.handler(*this, args);
    crab_log_failure(command, result);
    return result;
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Usage");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cout << theme::color::ORANGE
                  << fmt::format("    crab {:<28}", cmd.usage)
                  << theme::color::RESET
                  << theme::color::DIM
                  << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    crab --version                     Show version\n"
              << "    crab --help                        Show this help"
              << theme::color::RESET << "\n\n";
}
