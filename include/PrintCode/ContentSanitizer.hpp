// =================================================================
// include/PrintCode/ContentSanitizer.hpp
// =================================================================
// Header for conservative full-line comment and blank-line stripping.

#pragma once

#include <string>

namespace PrintCode {

/**
 * @brief Drops blank lines and full-line comments from file content
 *
 * A line is a full-line comment when its first non-whitespace characters
 * are the comment leader registered for the file's extension. Inline
 * trailing comments and block comments are never touched, so comment-like
 * text inside string literals survives. Extensions without a leader only
 * lose their blank lines.
 */
class ContentSanitizer {
public:
    /**
     * @brief Strip comments and blank lines
     * @param content Raw file content
     * @param extension File extension, any case, with or without dot
     * @return Kept lines, each terminated by '\n'
     */
    static std::string strip(const std::string& content, const std::string& extension);

    /**
     * @brief Comment leader for an extension
     * @return Empty string when the extension has no known leader
     */
    static std::string commentLeader(const std::string& extension);
};

} // namespace PrintCode
