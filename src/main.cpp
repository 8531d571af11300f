#include "Sieve/CliParser.hpp"
#include "Sieve/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser owns every command, option and flag of the CLI11 app.
    Sieve::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 signals --help and usage errors through ParseError; app->exit
    // prints the message and picks the exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core loads the configuration, sets up logging and dispatches to the
    // handler of the parsed subcommand.
    Sieve::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
