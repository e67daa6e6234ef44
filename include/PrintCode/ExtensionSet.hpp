// =================================================================
// include/PrintCode/ExtensionSet.hpp
// =================================================================
// Header for the normalized set of file extensions to include.

#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include <filesystem>

namespace PrintCode {

/**
 * @brief Lowercase, dot-less extensions a file must carry to be emitted
 *
 * Built once from every `--type` occurrence. Each raw value may hold
 * several comma-separated extensions; tokens are trimmed, stripped of
 * leading dots and lowercased. An empty result is a ConfigurationError.
 */
class ExtensionSet {
public:
    /**
     * @brief Build the set from raw, possibly comma-joined values
     * @param raw_values Values exactly as given on the command line
     * @throws ConfigurationError if no usable extension remains
     */
    explicit ExtensionSet(const std::vector<std::string>& raw_values);

    /**
     * @brief Case-insensitive membership test for a bare extension
     * @param extension Extension with or without a leading dot
     */
    bool contains(const std::string& extension) const;

    /**
     * @brief Test the extension of a path's final component
     * @param path File path; a name without extension never matches
     */
    bool matches(const std::filesystem::path& path) const;

    size_t size() const { return m_extensions.size(); }

    /**
     * @brief Extensions in sorted order, for logging
     */
    std::vector<std::string> sorted() const;

    /**
     * @brief Lowercase the extension of a path, without its dot
     * @return Empty string when the file name has no extension
     */
    static std::string extensionOf(const std::filesystem::path& path);

    /**
     * @brief Trim, strip leading dots and lowercase one token
     */
    static std::string normalize(const std::string& token);

private:
    std::unordered_set<std::string> m_extensions;
};

} // namespace PrintCode
