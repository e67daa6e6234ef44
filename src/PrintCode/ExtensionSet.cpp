// =================================================================
// src/PrintCode/ExtensionSet.cpp
// =================================================================
// Implementation for extension normalization and matching.

#include "PrintCode/ExtensionSet.hpp"
#include "PrintCode/Errors.hpp"
#include "PrintCode/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace PrintCode {

ExtensionSet::ExtensionSet(const std::vector<std::string>& raw_values) {
    for (const auto& raw : raw_values) {
        for (const auto& token : splitCommaList(raw)) {
            std::string ext = normalize(token);
            if (!ext.empty()) {
                m_extensions.insert(ext);
            }
        }
    }

    if (m_extensions.empty()) {
        throw ConfigurationError("No valid extensions provided (after normalisation).");
    }
}

bool ExtensionSet::contains(const std::string& extension) const {
    return m_extensions.find(normalize(extension)) != m_extensions.end();
}

bool ExtensionSet::matches(const std::filesystem::path& path) const {
    std::string ext = extensionOf(path);
    if (ext.empty()) {
        return false;
    }
    return m_extensions.find(ext) != m_extensions.end();
}

std::vector<std::string> ExtensionSet::sorted() const {
    std::vector<std::string> result(m_extensions.begin(), m_extensions.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::string ExtensionSet::extensionOf(const std::filesystem::path& path) {
    // ".bashrc" has no extension, "archive.tar.gz" has "gz"
    std::string ext = path.filename().extension().string();
    if (ext.size() <= 1) {
        return "";
    }
    return toLower(ext.substr(1));
}

std::string ExtensionSet::normalize(const std::string& token) {
    std::string result = trim(token);
    size_t first = result.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    return toLower(result.substr(first));
}

} // namespace PrintCode
