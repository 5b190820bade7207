#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_credentials_commands(BaseCLI& cli);
void register_database_commands(BaseCLI& cli);

class CrabCLI : public BaseCLI {
public:
    CrabCLI();

    // Dispatch argv[1..] and return the process exit code.
    int run(const std::vector<std::string>& argv);

private:
    void register_all_commands();

    // Print a failure with a hint where one helps.
    void report(const Result<void>& result, const std::string& command,
                const Args& args) const;
};
