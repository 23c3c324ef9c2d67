// =================================================================
// src/NameFmt/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "NameFmt/CliParser.hpp"

namespace NameFmt {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("namefmt: Format filenames according to configuration.", "namefmt");

    m_app->add_option("path", m_commands.path, "Path or file to process (default: current directory)");
    m_app->add_flag("-i,--inplace", m_commands.inplace, "Actually perform renames (default: dry-run mode)");
    m_app->add_option("-c,--config", m_commands.config_path, "Override config file location");
    m_app->add_flag("--timestamp", m_commands.timestamp, "Prefix YYYY_MM_DD__ to all filenames");
    m_app->add_flag("--keep-going", m_commands.keep_going,
                    "Continue with the remaining files after a failed rename");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug diagnostics on stderr");
    m_app->add_option("--log-dir", m_commands.log_dir, "Also write diagnostics to log files in this directory");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace NameFmt
