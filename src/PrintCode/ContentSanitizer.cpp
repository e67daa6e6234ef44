// =================================================================
// src/PrintCode/ContentSanitizer.cpp
// =================================================================
// Implementation for comment and blank-line stripping.

#include "PrintCode/ContentSanitizer.hpp"
#include "PrintCode/ExtensionSet.hpp"
#include <unordered_map>

namespace PrintCode {

namespace {

const std::unordered_map<std::string, std::string>& leaderTable() {
    static const std::unordered_map<std::string, std::string> table = {
        // Hash comments
        {"py", "#"}, {"sh", "#"}, {"bash", "#"}, {"zsh", "#"},
        {"rb", "#"}, {"yaml", "#"}, {"yml", "#"}, {"toml", "#"},
        // C-like line comments
        {"rs", "//"}, {"c", "//"}, {"h", "//"}, {"cpp", "//"},
        {"hpp", "//"}, {"cc", "//"}, {"js", "//"}, {"ts", "//"},
        {"java", "//"}, {"go", "//"}, {"cs", "//"}, {"swift", "//"},
        {"kt", "//"},
        // SQL
        {"sql", "--"}
    };
    return table;
}

// Byte length of the whitespace character at `pos`, or 0. Covers ASCII
// blanks and the Unicode White_Space characters encoded in UTF-8.
size_t blankLength(const std::string& text, size_t pos, size_t end) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    if (c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '\r') {
        return 1;
    }

    auto byteAt = [&text, end](size_t i) -> int {
        return i < end ? static_cast<unsigned char>(text[i]) : -1;
    };
    int b1 = byteAt(pos + 1);
    int b2 = byteAt(pos + 2);

    switch (c) {
        case 0xC2:
            // U+0085, U+00A0
            return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
        case 0xE1:
            // U+1680
            return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
        case 0xE2:
            if (b1 == 0x80) {
                // U+2000..U+200A, U+2028, U+2029, U+202F
                if ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) {
                    return 3;
                }
            } else if (b1 == 0x81 && b2 == 0x9F) {
                // U+205F
                return 3;
            }
            return 0;
        case 0xE3:
            // U+3000
            return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
        default:
            return 0;
    }
}

} // namespace

std::string ContentSanitizer::commentLeader(const std::string& extension) {
    const auto& table = leaderTable();
    auto it = table.find(ExtensionSet::normalize(extension));
    return it == table.end() ? std::string() : it->second;
}

std::string ContentSanitizer::strip(const std::string& content, const std::string& extension) {
    const std::string leader = commentLeader(extension);

    std::string out;
    out.reserve(content.size());

    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            end = content.size();
        }

        size_t line_end = end;
        if (line_end > start && content[line_end - 1] == '\r') {
            --line_end;
        }

        size_t first = start;
        while (first < line_end) {
            size_t width = blankLength(content, first, line_end);
            if (width == 0) {
                break;
            }
            first += width;
        }

        bool blank = (first == line_end);
        bool comment = !leader.empty() && content.compare(first, leader.size(), leader) == 0;

        if (!blank && !comment) {
            out.append(content, start, line_end - start);
            out += '\n';
        }

        start = end + 1;
    }

    return out;
}

} // namespace PrintCode
