// =================================================================
// src/PrintCode/StringUtils.cpp
// =================================================================
// Implementation for the shared string and path helpers.

#include "PrintCode/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace PrintCode {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

std::string toLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> splitCommaList(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            comma = s.size();
        }
        std::string piece = trim(s.substr(start, comma - start));
        if (!piece.empty()) {
            parts.push_back(piece);
        }
        start = comma + 1;
    }
    return parts;
}

std::string toSlashPath(const std::filesystem::path& path) {
    std::string result = path.generic_string();
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

} // namespace PrintCode
