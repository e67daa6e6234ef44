// =================================================================
// include/PrintCode/StringUtils.hpp
// =================================================================
// Small string helpers shared by the configuration and filter code.

#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace PrintCode {

// Trim spaces, tabs and line breaks from both ends.
std::string trim(const std::string& s);

// ASCII lowercase copy.
std::string toLower(const std::string& s);

// Split on ',' and trim each piece. Empty pieces are dropped.
std::vector<std::string> splitCommaList(const std::string& s);

// Generic path string with '/' separators, used for matching and display.
std::string toSlashPath(const std::filesystem::path& path);

} // namespace PrintCode
