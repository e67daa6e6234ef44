// =================================================================
// src/PrintCode/GlobMatcher.cpp
// =================================================================
// Implementation for glob to regex compilation.

#include "PrintCode/GlobMatcher.hpp"
#include "PrintCode/Errors.hpp"

namespace PrintCode {

namespace {

ConfigurationError invalidGlob(const std::string& pattern, const std::string& reason) {
    return ConfigurationError("Invalid --exclude glob pattern: " + pattern + " (" + reason + ")");
}

bool isRegexSpecial(char c) {
    switch (c) {
        case '.': case '^': case '$': case '+': case '(': case ')':
        case '{': case '}': case '|': case '[': case ']': case '\\':
        case '*': case '?':
            return true;
        default:
            return false;
    }
}

void appendLiteral(std::string& out, char c) {
    if (isRegexSpecial(c)) {
        out += '\\';
    }
    out += c;
}

} // namespace

GlobMatcher::GlobMatcher(const std::string& pattern)
    : m_pattern(pattern)
{
    std::string regex_pattern = globToRegex(pattern);
    try {
        m_regex = std::regex(regex_pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        throw invalidGlob(pattern, e.what());
    }
}

bool GlobMatcher::matches(const std::string& path) const {
    return std::regex_match(path, m_regex);
}

std::string GlobMatcher::globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern;
    bool in_group = false;
    const size_t n = glob_pattern.length();

    for (size_t i = 0; i < n; ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*': {
                if (i + 1 < n && glob_pattern[i + 1] == '*') {
                    // Group openers and separators also delimit a component
                    char prev = (i == 0) ? '/' : glob_pattern[i - 1];
                    char next = (i + 2 == n) ? '/' : glob_pattern[i + 2];
                    bool starts_component = prev == '/' ||
                        (in_group && (prev == '{' || prev == ','));
                    bool ends_component = next == '/' ||
                        (in_group && (next == ',' || next == '}'));
                    if (starts_component && ends_component) {
                        if (i + 2 < n && glob_pattern[i + 2] == '/') {
                            // **/ matches zero or more directories
                            regex_pattern += "(?:.*/)?";
                            i += 2;
                        } else {
                            // Trailing ** matches everything below
                            regex_pattern += ".*";
                            i += 1;
                        }
                        break;
                    }
                    // Not a full component: behaves like consecutive *
                    regex_pattern += ".*";
                    i += 1;
                    break;
                }
                regex_pattern += ".*";
                break;
            }

            case '?':
                regex_pattern += '.';
                break;

            case '[': {
                size_t j = i + 1;
                std::string cls = "[";
                if (j < n && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
                    cls += '^';
                    ++j;
                }
                // A ']' right after the opening bracket is literal
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
                if (!closed) {
                    throw invalidGlob(glob_pattern, "unclosed character class");
                }
                cls += ']';
                regex_pattern += cls;
                i = j;
                break;
            }

            case '{':
                if (in_group) {
                    throw invalidGlob(glob_pattern, "nested alternate groups are not allowed");
                }
                in_group = true;
                regex_pattern += "(?:";
                break;

            case '}':
                if (!in_group) {
                    throw invalidGlob(glob_pattern, "unopened alternate group");
                }
                in_group = false;
                regex_pattern += ')';
                break;

            case ',':
                if (in_group) {
                    regex_pattern += '|';
                } else {
                    regex_pattern += ',';
                }
                break;

            case '\\':
                if (i + 1 >= n) {
                    throw invalidGlob(glob_pattern, "dangling escape");
                }
                appendLiteral(regex_pattern, glob_pattern[++i]);
                break;

            default:
                appendLiteral(regex_pattern, c);
                break;
        }
    }

    if (in_group) {
        throw invalidGlob(glob_pattern, "unclosed alternate group");
    }

    return regex_pattern;
}

} // namespace PrintCode
