#include "NameFmt/CliParser.hpp"
#include "NameFmt/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments
    // using the CLI11 library.
    NameFmt::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports --help and usage errors through ParseError;
    // app->exit prints the message and yields the exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    NameFmt::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
