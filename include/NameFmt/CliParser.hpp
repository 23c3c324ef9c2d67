// =================================================================
// include/NameFmt/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace NameFmt {

// A simple struct to hold parsed command information.
struct Commands {
    std::string path = ".";     // File or directory to process
    bool inplace = false;       // Perform renames instead of a dry run
    std::string config_path;    // Overrides the per-user config file when set
    bool timestamp = false;     // Prefix YYYY_MM_DD__ to every name
    bool keep_going = false;    // Continue after a failed rename
    bool verbose = false;
    std::string log_dir;        // Also write logs to files in this directory
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace NameFmt
