#include "crab_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

CrabCLI::CrabCLI() : BaseCLI() {
    register_all_commands();
}

void CrabCLI::register_all_commands() {
    register_credentials_commands(*this);
    register_database_commands(*this);

    add_command("help", [this](BaseCLI&, const Args&) {
        this->print_help();
        return Result<void>::Ok();
    }, "help", "Show this help message");
}

int CrabCLI::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        print_help();
        return EXIT_USAGE;
    }

    const std::string& cmd = argv[0];
    if (cmd == "--version" || cmd == "-V") {
        std::cout << theme::color::ORANGE << theme::color::BOLD << "crab"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << CRAB_VERSION << theme::color::RESET << "\n";
        return EXIT_OK;
    }
    if (cmd == "--help" || cmd == "-h") {
        print_help();
        return EXIT_OK;
    }

    Args args(argv.begin() + 1, argv.end());
    auto result = execute_command(cmd, args);
    if (result.is_ok()) {
        return EXIT_OK;
    }
    report(result, cmd, args);
    return exit_code_for(result.kind);
}

void CrabCLI::report(const Result<void>& result, const std::string& command,
                     const Args& args) const {
    switch (result.kind) {
        case ErrorKind::UserCancelled:
            std::cout << theme::info("Operation cancelled.");
            break;
        case ErrorKind::DatabaseNotFound:
            std::cerr << theme::fail(result.error);
            std::cerr << theme::step("Try running 'crab add' to create your first credential.");
            break;
        case ErrorKind::CredentialNotFound: {
            std::string service = args.empty() ? "<service>" : args[0];
            std::cerr << theme::fail(result.error);
            std::cerr << theme::step("Try 'crab list' to see available services or 'crab add -s "
                                     + service + "' to create it.");
            break;
        }
        case ErrorKind::InvalidArgument:
            std::cerr << theme::fail(result.error);
            if (!has_command(command)) print_help();
            break;
        case ErrorKind::Locked:
            std::cerr << theme::fail(result.error);
            std::cerr << theme::step("Wait for the other process to finish and try again.");
            break;
        default:
            std::cerr << theme::fail("Error: " + result.error);
            break;
    }
}
