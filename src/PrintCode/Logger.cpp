// =================================================================
// src/PrintCode/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "PrintCode/Logger.hpp"
#include "PrintCode/Core.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <unistd.h>

namespace PrintCode {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : m_console_level(LogLevel::WARNING),
      m_file_level(LogLevel::DEBUG),
      m_console_enabled(true),
      m_console_color(isatty(STDERR_FILENO) != 0)
{
}

Logger::~Logger() {
    flush();
}

bool Logger::openLogFile(const std::string& log_file) {
    auto file = std::make_unique<std::ofstream>(log_file, std::ios::app);
    if (!file->is_open()) {
        return false;
    }

    m_log_file = std::move(file);
    m_log_filename = log_file;
    debug("Logger", "Log file opened", m_log_filename);
    return true;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logScanSummary(const ScanStats& stats) {
    std::ostringstream context;
    context << "Roots: " << stats.roots_scanned << ", ";
    context << "Candidates: " << stats.candidates << ", ";
    context << "Emitted: " << stats.emitted;

    info("Core", "Scan completed", context.str());

    std::ostringstream rejected;
    rejected << "extension=" << stats.rejected_extension << ", ";
    rejected << "excluded=" << stats.rejected_excluded << ", ";
    rejected << "size=" << stats.rejected_size;
    debug("Core", "Rejected candidates", rejected.str());

    if (stats.read_errors > 0 || stats.walk_errors > 0) {
        std::ostringstream errors;
        errors << "Read errors: " << stats.read_errors << ", ";
        errors << "Walk errors: " << stats.walk_errors;
        warning("Core", "Some entries could not be processed", errors.str());
    }
}

void Logger::logRunStart(size_t root_count, const std::string& mode) {
    std::ostringstream context;
    context << "Roots: " << root_count << ", ";
    context << "Mode: " << mode;

    info("Session", "Run started", context.str());
}

void Logger::logRunEnd(int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Run completed successfully", context.str());
    } else {
        error("Session", "Run completed with errors", context.str());
    }
}

void Logger::flush() {
    if (m_log_file && m_log_file->is_open()) {
        m_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, m_console_color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file || entry.level < m_file_level) {
        return;
    }

    *m_log_file << formatEntry(entry, false) << '\n';

    // Flush errors immediately so they survive an abnormal exit
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace PrintCode
