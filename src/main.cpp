#include <iostream>
#include <vector>
#include <string>
#include "cli/crab_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <platform/terminal.hpp>

int main(int argc, char** argv) {
    // Ctrl-C at any prompt leaves the database untouched: saves only ever
    // happen through an atomic rename after the last prompt.
    platform::exit_on_interrupt(EXIT_CANCELLED);

    try {
        CrabCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail("Error: " + std::string(e.what()));
        return EXIT_IO;
    }
}
