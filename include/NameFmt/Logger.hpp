// =================================================================
// include/NameFmt/Logger.hpp
// =================================================================
// Header for leveled diagnostics on stderr and optional log files.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace NameFmt {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Logging system for diagnostics
 *
 * Console output goes to stderr so that stdout only carries the
 * rename report. File output is disabled unless a log directory is
 * given to initialize().
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files, empty to disable file output
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = "",
                   size_t max_log_size = 1024 * 1024,  // 1MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the result of a candidate scan
     * @param root Scanned root path
     * @param files Candidate files found
     */
    void logScanResults(const std::string& root, const std::vector<std::string>& files);

    /**
     * @brief Log the totals of a rename run
     * @param candidates Files examined
     * @param planned Files whose name changes
     * @param applied Renames performed on disk
     * @param failed Renames that failed
     */
    void logRunSummary(size_t candidates, size_t planned, size_t applied, size_t failed);

    /**
     * @brief Log session start
     * @param target Path being processed
     * @param inplace Whether renames are applied
     */
    void logSessionStart(const std::string& target, bool inplace);

    /**
     * @brief Log session end
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_color_enabled = false;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param for_console Console format: no timestamp, optional color
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool for_console);

    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    bool ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    NameFmt::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    NameFmt::Logger::getInstance().info(component, message)

#define LOG_ERROR(component, message) \
    NameFmt::Logger::getInstance().error(component, message)

} // namespace NameFmt
