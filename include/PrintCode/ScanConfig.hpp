// =================================================================
// include/PrintCode/ScanConfig.hpp
// =================================================================
// Configuration structure for one scanning run.

#pragma once

#include "PrintCode/Emitter.hpp"
#include "PrintCode/IgnoreWalker.hpp"
#include "PrintCode/Logger.hpp"
#include "PrintCode/SelectionFilter.hpp"
#include <string>
#include <vector>

namespace PrintCode {

class ConfigParser;
struct Commands;

/**
 * @brief Every setting of a run, after defaults, file and command line merge
 */
struct ScanConfig {
    // Selection
    std::vector<std::string> roots;
    std::vector<std::string> types;
    std::vector<std::string> excludes;
    SizeLimit size_limit;

    // Traversal
    WalkOptions walk;

    // Output
    bool strip_comments = false;
    bool end_marker = false;
    OutputMode output_mode = OutputMode::Text;

    // Diagnostics
    LogLevel log_level = LogLevel::WARNING;
    std::string log_file;

    /**
     * @brief Load configuration from a parsed YAML file
     * @param config ConfigParser instance
     * @throws ConfigurationError on values of the wrong type
     */
    void loadFromConfig(const ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Turn all three ignore sources on or off together
     */
    void setRespectIgnores(bool enabled);

    /**
     * @brief Validate configuration settings
     * @throws ConfigurationError when no extension was requested
     */
    void validate() const;

    /**
     * @brief Build the configuration for a command line
     *
     * Reads `--config` when given (it must exist), otherwise `.pc.yml` in
     * the working directory when present, then applies the command line.
     */
    static ScanConfig resolve(const Commands& commands);

    /**
     * @brief Parse debug|info|warning|error|critical
     * @throws ConfigurationError on an unknown level name
     */
    static LogLevel parseLogLevel(const std::string& name);
};

} // namespace PrintCode
