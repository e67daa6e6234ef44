// =================================================================
// include/PrintCode/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <string>
#include <vector>
#include <regex>
#include <filesystem>

namespace PrintCode {

/**
 * @brief Outcome of testing a path against ignore rules
 */
enum class IgnoreMatch {
    None,       ///< No rule matched
    Ignore,     ///< Last matching rule hides the path
    Whitelist   ///< Last matching rule is a `!` negation
};

/**
 * @brief Gitignore-compatible pattern matching utility
 *
 * Supports the gitignore pattern syntax:
 * - Wildcards: *, ?, [...] (none of them match '/')
 * - Double star: **\/x, x/**, a/**\/b
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchoring: a pattern with a '/' other than a trailing one is relative
 *   to the directory holding the ignore file; otherwise it matches the
 *   entry name at any depth
 * - Comment lines: # comment, with \# and \! for literal leaders
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style line
     * @param pattern The pattern string
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     * @param path Path relative to the ignore file's directory, '/' separated
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isAnchored() const { return m_is_anchored; }
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Check if pattern is empty or comment
     * @return true if pattern should be ignored
     */
    bool isEmpty() const { return m_is_empty; }

private:
    std::string m_original_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    void processPattern(const std::string& pattern);

    /**
     * @brief Convert gitignore glob pattern to regex
     * @param glob_pattern Glob pattern string
     * @return Equivalent regex pattern
     */
    std::string globToRegex(const std::string& glob_pattern) const;
};

/**
 * @brief Ordered rules read from one ignore source, scoped to a directory
 */
class IgnorePatternSet {
public:
    IgnorePatternSet() = default;

    /**
     * @brief Create an empty set whose patterns are relative to base_dir
     */
    explicit IgnorePatternSet(const std::filesystem::path& base_dir);

    void addPattern(const std::string& pattern);

    /**
     * @brief Load patterns from a file (e.g., .gitignore)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Evaluate the rules for a path; the last matching rule wins
     * @param path Absolute path of the entry
     * @param is_directory True if path is a directory
     */
    IgnoreMatch match(const std::filesystem::path& path, bool is_directory) const;

    /**
     * @brief Same as match() on a path already relative to the base
     */
    IgnoreMatch matchRelative(const std::string& relative_path, bool is_directory) const;

    /**
     * @brief Check if a path should be ignored
     */
    bool shouldIgnore(const std::filesystem::path& path, bool is_directory = false) const {
        return match(path, is_directory) == IgnoreMatch::Ignore;
    }

    const std::filesystem::path& getBaseDir() const { return m_base_dir; }

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }
    void clear() { m_patterns.clear(); }

private:
    std::filesystem::path m_base_dir;
    std::vector<IgnorePattern> m_patterns;
};

} // namespace PrintCode
