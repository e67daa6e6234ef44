// =================================================================
// src/PrintCode/ScanConfig.cpp
// =================================================================
// Implementation for run configuration management.

#include "PrintCode/ScanConfig.hpp"
#include "PrintCode/CliParser.hpp"
#include "PrintCode/ConfigParser.hpp"
#include "PrintCode/Errors.hpp"
#include "PrintCode/StringUtils.hpp"

namespace PrintCode {

void ScanConfig::loadFromConfig(const ConfigParser& config) {
    if (!config.isLoaded()) {
        return;
    }

    for (const auto& type : config.getStringList("types")) {
        types.push_back(type);
    }
    for (const auto& pattern : config.getStringList("exclude")) {
        excludes.push_back(pattern);
    }

    if (config.getBoolValue("no_gitignore", false)) {
        setRespectIgnores(false);
    }
    walk.follow_symlinks = config.getBoolValue("follow_symlinks", walk.follow_symlinks);
    walk.include_hidden = config.getBoolValue("hidden", walk.include_hidden);

    strip_comments = config.getBoolValue("strip_comments", strip_comments);
    end_marker = config.getBoolValue("end_marker", end_marker);
    if (config.getBoolValue("json", false)) {
        output_mode = OutputMode::Json;
    }

    if (config.hasKey("max_bytes")) {
        size_limit.enabled = true;
        size_limit.max_bytes = config.getUnsignedValue("max_bytes", 0);
    }

    std::string level = config.getStringValue("log_level");
    if (!level.empty()) {
        log_level = parseLogLevel(level);
    }

    std::string file = config.getStringValue("log_file");
    if (!file.empty()) {
        log_file = file;
    }
}

void ScanConfig::applyCommandOverrides(const Commands& commands) {
    roots = commands.paths;
    if (roots.empty()) {
        roots.push_back(".");
    }

    // Lists from the file and the command line are merged
    types.insert(types.end(), commands.types.begin(), commands.types.end());
    excludes.insert(excludes.end(), commands.excludes.begin(), commands.excludes.end());

    if (commands.no_gitignore) {
        setRespectIgnores(false);
    }
    if (commands.follow_symlinks) {
        walk.follow_symlinks = true;
    }
    if (commands.hidden) {
        walk.include_hidden = true;
    }
    if (commands.strip_comments) {
        strip_comments = true;
    }
    if (commands.end_marker) {
        end_marker = true;
    }
    if (commands.json) {
        output_mode = OutputMode::Json;
    }
    if (commands.max_bytes_set) {
        size_limit.enabled = true;
        size_limit.max_bytes = commands.max_bytes;
    }

    if (commands.quiet) {
        log_level = LogLevel::ERROR;
    } else if (commands.verbosity >= 2) {
        log_level = LogLevel::DEBUG;
    } else if (commands.verbosity == 1) {
        log_level = LogLevel::INFO;
    }

    if (!commands.log_file.empty()) {
        log_file = commands.log_file;
    }
}

void ScanConfig::setRespectIgnores(bool enabled) {
    walk.respect_gitignore = enabled;
    walk.respect_ignore_files = enabled;
    walk.respect_global_excludes = enabled;
}

void ScanConfig::validate() const {
    bool any_type = false;
    for (const auto& raw : types) {
        if (!trim(raw).empty()) {
            any_type = true;
            break;
        }
    }
    if (!any_type) {
        throw ConfigurationError("No extensions given; use --type (e.g. -t py).");
    }
}

ScanConfig ScanConfig::resolve(const Commands& commands) {
    ScanConfig config;

    if (!commands.config_path.empty()) {
        config.loadFromConfig(ConfigParser(commands.config_path, true));
    } else {
        config.loadFromConfig(ConfigParser(ConfigParser::DEFAULT_CONFIG_FILE, false));
    }

    config.applyCommandOverrides(commands);
    config.validate();
    return config;
}

LogLevel ScanConfig::parseLogLevel(const std::string& name) {
    std::string level = toLower(trim(name));
    if (level == "debug") return LogLevel::DEBUG;
    if (level == "info") return LogLevel::INFO;
    if (level == "warning" || level == "warn") return LogLevel::WARNING;
    if (level == "error") return LogLevel::ERROR;
    if (level == "critical") return LogLevel::CRITICAL;
    throw ConfigurationError("Unknown log level '" + name + "'");
}

} // namespace PrintCode
