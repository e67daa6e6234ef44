// =================================================================
// include/PrintCode/Logger.hpp
// =================================================================
// Header for leveled, component-tagged logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <cstddef>

namespace PrintCode {

struct ScanStats;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
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
 * @brief Process-wide logger
 *
 * Console output always goes to stderr because stdout carries the scanned
 * file content. An optional log file receives every entry at or above the
 * file level, without colour codes.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Open a log file in addition to console output
     * @param log_file Path of the file to append to
     * @return false if the file could not be opened
     */
    bool openLogFile(const std::string& log_file);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on stderr
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to the log file
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    LogLevel getConsoleLogLevel() const { return m_console_level; }

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the counters collected during one run
     * @param stats Totals across every scanned root
     */
    void logScanSummary(const ScanStats& stats);

    /**
     * @brief Log run start
     * @param root_count Number of roots requested
     * @param mode Output mode name
     */
    void logRunStart(size_t root_count, const std::string& mode);

    /**
     * @brief Log run end
     * @param exit_code Exit code about to be returned
     * @param duration_ms Run duration in milliseconds
     */
    void logRunEnd(int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger();
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level;
    LogLevel m_file_level;
    bool m_console_enabled;
    bool m_console_color;

    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

// Convenience macros for logging
#define PC_LOG_DEBUG(component, message) \
    PrintCode::Logger::getInstance().debug(component, message)

#define PC_LOG_INFO(component, message) \
    PrintCode::Logger::getInstance().info(component, message)

#define PC_LOG_WARNING(component, message) \
    PrintCode::Logger::getInstance().warning(component, message)

#define PC_LOG_ERROR(component, message) \
    PrintCode::Logger::getInstance().error(component, message)

#define PC_LOG_CRITICAL(component, message) \
    PrintCode::Logger::getInstance().critical(component, message)

} // namespace PrintCode
