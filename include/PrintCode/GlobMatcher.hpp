// =================================================================
// include/PrintCode/GlobMatcher.hpp
// =================================================================
// Header for compiling user glob patterns into path matchers.

#pragma once

#include <string>
#include <regex>

namespace PrintCode {

/**
 * @brief A compiled glob that matches whole root-relative paths
 *
 * Supported syntax:
 * - `*` any run of characters, `?` any single character (both also
 *   match '/', so `*.gen.py` matches `a/b.gen.py`)
 * - `**` as a full path component: `**\/x`, `x/**`, `a/**\/b`
 * - Character classes: `[abc]`, `[a-z]`, `[!a]`, `[^a]`
 * - Alternation: `{a,b}` (no nesting)
 * - `\` escapes the next character
 */
class GlobMatcher {
public:
    /**
     * @brief Compile a glob pattern
     * @param pattern Glob pattern, already trimmed
     * @throws ConfigurationError if the pattern is malformed
     */
    explicit GlobMatcher(const std::string& pattern);

    /**
     * @brief Match the complete path against the pattern
     * @param path Slash-separated path relative to the scan root
     */
    bool matches(const std::string& path) const;

    const std::string& getPattern() const { return m_pattern; }

    /**
     * @brief Translate a glob into an ECMAScript regular expression
     * @throws ConfigurationError if the pattern is malformed
     */
    static std::string globToRegex(const std::string& glob_pattern);

private:
    std::string m_pattern;
    std::regex m_regex;
};

} // namespace PrintCode
