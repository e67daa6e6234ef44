// =================================================================
// src/PrintCode/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration reader.

#include "PrintCode/ConfigParser.hpp"
#include "PrintCode/Errors.hpp"
#include "PrintCode/Logger.hpp"
#include <filesystem>

namespace PrintCode {

const char* const ConfigParser::DEFAULT_CONFIG_FILE = ".pc.yml";

ConfigParser::ConfigParser(const std::string& config_path, bool required)
    : m_path(config_path),
      m_loaded(false)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        if (required) {
            throw ConfigurationError("Configuration file not found: " + config_path);
        }
        // It's okay for the default file not to exist.
        return;
    }

    try {
        m_root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse configuration file " + config_path + ": " + e.what());
    }

    if (m_root.IsNull()) {
        m_root = YAML::Node(YAML::NodeType::Map);
    } else if (!m_root.IsMap()) {
        throw ConfigurationError("Configuration file " + config_path + " must contain a mapping");
    }

    m_loaded = true;
    Logger::getInstance().debug("ConfigParser", "Loaded configuration", config_path);
}

YAML::Node ConfigParser::lookup(const std::string& key) const {
    if (!m_loaded) {
        return YAML::Node();
    }
    // operator[] on a const node never inserts
    const YAML::Node& root = m_root;
    return root[key];
}

bool ConfigParser::hasKey(const std::string& key) const {
    YAML::Node node = lookup(key);
    return node.IsDefined() && !node.IsNull();
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    YAML::Node node = lookup(key);
    if (!node.IsDefined() || node.IsNull()) {
        return "";
    }
    if (!node.IsScalar()) {
        throw ConfigurationError("Configuration key '" + key + "' must be a string");
    }
    return node.as<std::string>();
}

bool ConfigParser::getBoolValue(const std::string& key, bool fallback) const {
    YAML::Node node = lookup(key);
    if (!node.IsDefined() || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError("Configuration key '" + key + "' must be true or false");
    }
}

std::uint64_t ConfigParser::getUnsignedValue(const std::string& key, std::uint64_t fallback) const {
    YAML::Node node = lookup(key);
    if (!node.IsDefined() || node.IsNull()) {
        return fallback;
    }
    // yaml-cpp wraps negative input into a large unsigned value
    if (!node.IsScalar() || node.Scalar().empty() || node.Scalar()[0] == '-') {
        throw ConfigurationError("Configuration key '" + key + "' must be a non-negative integer");
    }
    try {
        return node.as<std::uint64_t>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError("Configuration key '" + key + "' must be a non-negative integer");
    }
}

std::vector<std::string> ConfigParser::getStringList(const std::string& key) const {
    std::vector<std::string> values;
    YAML::Node node = lookup(key);
    if (!node.IsDefined() || node.IsNull()) {
        return values;
    }

    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }

    if (!node.IsSequence()) {
        throw ConfigurationError("Configuration key '" + key + "' must be a list of strings");
    }

    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigurationError("Configuration key '" + key + "' must be a list of strings");
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

} // namespace PrintCode
