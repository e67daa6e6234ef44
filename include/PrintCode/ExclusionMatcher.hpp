// =================================================================
// include/PrintCode/ExclusionMatcher.hpp
// =================================================================
// Header for the user-supplied exclusion glob set.

#pragma once

#include "PrintCode/GlobMatcher.hpp"
#include <string>
#include <vector>

namespace PrintCode {

/**
 * @brief Immutable set of `--exclude` globs tested against root-relative paths
 *
 * Built once from every `--exclude` occurrence and shared read-only by all
 * roots. Because the paths it receives are relative to the root being
 * walked, the same patterns are re-evaluated independently for each root.
 * An empty set never excludes anything.
 */
class ExclusionMatcher {
public:
    ExclusionMatcher() = default;

    /**
     * @brief Compile raw, possibly comma-joined values
     * @param raw_values Values exactly as given on the command line
     * @throws ConfigurationError naming the first malformed pattern
     */
    explicit ExclusionMatcher(const std::vector<std::string>& raw_values);

    /**
     * @brief True if any pattern matches the root-relative path
     */
    bool isExcluded(const std::string& relative_path) const;

    /**
     * @brief Directory check used to prune whole subtrees
     *
     * Also tries the path with a trailing '/', so `tests/**` prunes `tests`.
     */
    bool isExcludedDirectory(const std::string& relative_path) const;

    bool empty() const { return m_globs.empty(); }
    size_t size() const { return m_globs.size(); }

    /**
     * @brief Split a raw value on commas that are outside `{}` and `[]`
     */
    static std::vector<std::string> splitPatterns(const std::string& raw);

private:
    std::vector<GlobMatcher> m_globs;
};

} // namespace PrintCode
