// =================================================================
// src/PrintCode/ExclusionMatcher.cpp
// =================================================================
// Implementation for the exclusion glob set.

#include "PrintCode/ExclusionMatcher.hpp"
#include "PrintCode/StringUtils.hpp"
#include "PrintCode/Logger.hpp"

namespace PrintCode {

ExclusionMatcher::ExclusionMatcher(const std::vector<std::string>& raw_values) {
    for (const auto& raw : raw_values) {
        for (const auto& pattern : splitPatterns(raw)) {
            m_globs.emplace_back(pattern);
            PC_LOG_DEBUG("ExclusionMatcher", "Compiled exclude pattern: " + pattern);
        }
    }
}

bool ExclusionMatcher::isExcluded(const std::string& relative_path) const {
    for (const auto& glob : m_globs) {
        if (glob.matches(relative_path)) {
            return true;
        }
    }
    return false;
}

bool ExclusionMatcher::isExcludedDirectory(const std::string& relative_path) const {
    if (m_globs.empty()) {
        return false;
    }
    if (isExcluded(relative_path)) {
        return true;
    }
    if (!relative_path.empty() && relative_path.back() != '/') {
        return isExcluded(relative_path + "/");
    }
    return false;
}

std::vector<std::string> ExclusionMatcher::splitPatterns(const std::string& raw) {
    std::vector<std::string> patterns;
    std::string current;
    int brace_depth = 0;
    bool in_class = false;

    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\' && i + 1 < raw.size()) {
            current += c;
            current += raw[++i];
            continue;
        }
        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
        } else if (c == '[') {
            in_class = true;
        } else if (c == '{') {
            ++brace_depth;
        } else if (c == '}' && brace_depth > 0) {
            --brace_depth;
        } else if (c == ',' && brace_depth == 0) {
            std::string piece = trim(current);
            if (!piece.empty()) {
                patterns.push_back(piece);
            }
            current.clear();
            continue;
        }
        current += c;
    }

    std::string piece = trim(current);
    if (!piece.empty()) {
        patterns.push_back(piece);
    }
    return patterns;
}

} // namespace PrintCode
