// =================================================================
// include/PrintCode/ConfigParser.hpp
// =================================================================
// Defines a reader for the optional .pc.yml configuration file.

#pragma once

#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string>
#include <vector>

namespace PrintCode {

class ConfigParser {
public:
    /**
     * @brief Default configuration file looked up in the working directory
     */
    static const char* const DEFAULT_CONFIG_FILE;

    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to the YAML file.
     * @param required When false a missing file yields an empty configuration.
     * @throws ConfigurationError if the file is required but missing, cannot
     *         be parsed, or its top level is not a mapping.
     */
    explicit ConfigParser(const std::string& config_path, bool required = false);

    bool isLoaded() const { return m_loaded; }
    bool hasKey(const std::string& key) const;
    const std::string& getPath() const { return m_path; }

    /**
     * @brief Retrieves a string value for a given key.
     * @return The value, or an empty string if not found.
     * @throws ConfigurationError if the value is not a scalar.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Retrieves a boolean, or the fallback if the key is absent.
     * @throws ConfigurationError if the value is not a boolean.
     */
    bool getBoolValue(const std::string& key, bool fallback) const;

    /**
     * @brief Retrieves a non-negative integer.
     * @throws ConfigurationError if the value is not a non-negative integer.
     */
    std::uint64_t getUnsignedValue(const std::string& key, std::uint64_t fallback) const;

    /**
     * @brief Retrieves a YAML sequence of strings, or a single scalar as one item.
     */
    std::vector<std::string> getStringList(const std::string& key) const;

private:
    std::string m_path;
    bool m_loaded;
    YAML::Node m_root;

    YAML::Node lookup(const std::string& key) const;
};

} // namespace PrintCode
