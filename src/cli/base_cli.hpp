#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <core/types.hpp>
#include <storage/credential_file.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<Result<void>(BaseCLI&, const Args&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    // Resolve the database path from the config (once) and open it.
    // Fails with PathResolution when no home directory can be found.
    Result<void> require_database();

    // require_database() plus the writer lock, held until the returned
    // object is destroyed. Every command that saves takes this first.
    Result<std::unique_ptr<FileLock>> lock_database();

    // Load the config. A bad config file is reported, not ignored.
    Result<void> require_config();

    // Run a registered command. Unknown names fail with InvalidArgument.
    Result<void> execute_command(const std::string& command, const Args& args);
    void print_help() const;

    bool has_command(const std::string& name) const { return commands_.count(name) != 0; }

    // Public state
    Config config;
    std::optional<CredentialFile> db;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;
    bool config_loaded_ = false;
};
