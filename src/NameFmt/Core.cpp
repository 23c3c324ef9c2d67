// =================================================================
// src/NameFmt/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "NameFmt/Core.hpp"
#include "NameFmt/ConfigLoader.hpp"
#include "NameFmt/Logger.hpp"
#include "NameFmt/Renamer.hpp"
#include <chrono>
#include <stdexcept>

namespace NameFmt {

Core::Core(const Commands& commands, std::ostream& out)
    : m_commands(commands),
      m_out(out)
{
}

int Core::run() {
    setupLogging();
    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.path, m_commands.inplace);

    int exit_code = 0;
    try {
        std::string config_path = ConfigLoader::resolveConfigPath(m_commands.config_path);
        ConfigLoader loader(config_path);
        FormatConfig config = loader.load();

        RenameOptions options;
        options.inplace = m_commands.inplace;
        options.timestamp = m_commands.timestamp;
        options.error_policy = m_commands.keep_going ? ErrorPolicy::Continue : ErrorPolicy::Abort;

        Renamer renamer(config, options, m_out);
        RenameSummary summary = renamer.processPath(m_commands.path);

        if (!summary.success()) {
            std::cerr << "Error: " << summary.failures.size() << " file(s) could not be renamed" << std::endl;
            exit_code = 1;
        }
    } catch (const std::runtime_error& e) {
        // Covers std::filesystem::filesystem_error as well
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(exit_code, static_cast<long>(duration.count()));
    Logger::getInstance().flush();

    return exit_code;
}

void Core::setupLogging() {
    Logger& logger = Logger::getInstance();
    logger.initialize(m_commands.log_dir);
    logger.setConsoleLogLevel(m_commands.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
}

} // namespace NameFmt
