// =================================================================
// include/PrintCode/Errors.hpp
// =================================================================
// Exception types shared by the scanning pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace PrintCode {

/**
 * @brief Fatal, pre-scan problem with the requested configuration
 *
 * Raised for an empty extension set, a malformed exclusion glob, or an
 * unusable configuration file. Nothing has been written to the output
 * stream when this is thrown.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A single file could not be read or decoded
 */
class ReadError : public std::runtime_error {
public:
    explicit ReadError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace PrintCode
