// =================================================================
// src/PrintCode/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "PrintCode/IgnorePattern.hpp"
#include "PrintCode/Logger.hpp"
#include "PrintCode/StringUtils.hpp"
#include <fstream>

namespace PrintCode {

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }

    // Directory-only patterns only match directories
    if (m_directory_only && !is_directory) {
        return false;
    }

    if (m_is_anchored) {
        return std::regex_match(path, m_regex);
    }

    // Unanchored patterns match the entry name at any depth
    size_t slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return std::regex_match(name, m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    if (!working_pattern.empty() && working_pattern.back() == '\r') {
        working_pattern.pop_back();
    }

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    // Trailing spaces are dropped unless escaped
    while (!working_pattern.empty() && (working_pattern.back() == ' ' || working_pattern.back() == '\t')) {
        size_t len = working_pattern.size();
        if (len >= 2 && working_pattern[len - 2] == '\\') {
            break;
        }
        working_pattern.pop_back();
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    // Handle negation patterns
    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    } else if (working_pattern.size() >= 2 && working_pattern[0] == '\\' &&
               (working_pattern[1] == '!' || working_pattern[1] == '#')) {
        working_pattern = working_pattern.substr(1);
    }

    // Handle directory-only patterns
    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    // Any remaining slash anchors the pattern to the ignore file's directory
    if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
        if (working_pattern[0] == '/') {
            working_pattern = working_pattern.substr(1);
        }
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    std::string regex_pattern = globToRegex(working_pattern);

    try {
        m_regex = std::regex(regex_pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("IgnorePattern",
            "Failed to compile pattern '" + pattern + "'", e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string regex_pattern;
    const size_t n = glob_pattern.length();

    for (size_t i = 0; i < n; ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*':
                if (i + 1 < n && glob_pattern[i + 1] == '*') {
                    bool starts_component = (i == 0) || glob_pattern[i - 1] == '/';
                    bool ends_component = (i + 2 == n) || glob_pattern[i + 2] == '/';
                    if (starts_component && ends_component) {
                        if (i + 2 == n) {
                            // Trailing /** matches everything inside
                            regex_pattern += ".*";
                            i += 1;
                        } else {
                            // **/ matches zero or more directories
                            regex_pattern += "(?:.*/)?";
                            i += 2;
                        }
                        break;
                    }
                    regex_pattern += "[^/]*";
                    i += 1;
                    break;
                }
                // * matches anything except /
                regex_pattern += "[^/]*";
                break;

            case '?':
                // ? matches any single character except /
                regex_pattern += "[^/]";
                break;

            case '[': {
                size_t j = i + 1;
                std::string cls = "[";
                if (j < n && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
                    cls += '^';
                    ++j;
                }
                if (j < n && glob_pattern[j] == ']') {
                    cls += "\\]";
                    ++j;
                }
                bool closed = false;
                for (; j < n; ++j) {
                    char k = glob_pattern[j];
                    if (k == ']') {
                        closed = true;
                        break;
                    }
                    if (k == '\\' || k == '[' || k == '^') {
                        cls += '\\';
                    }
                    cls += k;
                }
                if (closed) {
                    regex_pattern += cls + "]";
                    i = j;
                } else {
                    // git treats an unclosed bracket literally
                    regex_pattern += "\\[";
                }
                break;
            }

            case '\\':
                // Escape the next character
                if (i + 1 < n) {
                    char next = glob_pattern[++i];
                    if (std::string(".^$+(){}|[]\\*?").find(next) != std::string::npos) {
                        regex_pattern += '\\';
                    }
                    regex_pattern += next;
                } else {
                    regex_pattern += "\\\\";
                }
                break;

            default:
                if (c == '.' || c == '^' || c == '$' || c == '+' || c == ']' ||
                    c == '{' || c == '}' || c == '|' || c == '(' || c == ')') {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                break;
        }
    }

    return regex_pattern;
}

// IgnorePatternSet implementation

IgnorePatternSet::IgnorePatternSet(const std::filesystem::path& base_dir)
    : m_base_dir(base_dir)
{
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromFile(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        IgnorePattern pattern(line);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }

    return patterns_loaded;
}

IgnoreMatch IgnorePatternSet::match(const std::filesystem::path& path, bool is_directory) const {
    if (m_patterns.empty()) {
        return IgnoreMatch::None;
    }

    std::filesystem::path relative = path.lexically_relative(m_base_dir);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        // Outside this set's directory
        return IgnoreMatch::None;
    }

    return matchRelative(toSlashPath(relative), is_directory);
}

IgnoreMatch IgnorePatternSet::matchRelative(const std::string& relative_path, bool is_directory) const {
    // Process patterns in reverse: the last matching rule decides
    for (auto it = m_patterns.rbegin(); it != m_patterns.rend(); ++it) {
        if (it->matches(relative_path, is_directory)) {
            return it->isNegation() ? IgnoreMatch::Whitelist : IgnoreMatch::Ignore;
        }
    }
    return IgnoreMatch::None;
}

} // namespace PrintCode
