// =================================================================
// include/PrintCode/IgnoreWalker.hpp
// =================================================================
// Header for ignore-aware directory traversal.

#pragma once

#include "PrintCode/IgnorePattern.hpp"
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

namespace PrintCode {

/**
 * @brief Which ignore sources and entry kinds the walker honors
 */
struct WalkOptions {
    bool respect_gitignore = true;          ///< .gitignore files and .git/info/exclude
    bool respect_ignore_files = true;       ///< .ignore files
    bool respect_global_excludes = true;    ///< core.excludesFile from the user git config
    bool follow_symlinks = false;
    bool include_hidden = false;

    bool anyIgnoreSource() const {
        return respect_gitignore || respect_ignore_files || respect_global_excludes;
    }
};

/**
 * @brief A regular file discovered under a scan root
 *
 * Only exists while its root is being walked. The byte size is not part
 * of the candidate; the size check stats the file only when it is reached.
 */
struct Candidate {
    std::filesystem::path absolute_path;
    std::string relative_path;          ///< Root-relative, '/' separated
    std::string file_name;
};

/**
 * @brief Walks one scan root and yields the files ignore rules leave visible
 *
 * Traversal is depth first with the entries of each directory visited in
 * byte-wise name order, so repeated walks of an unchanged tree yield the
 * same sequence. Ignored and pruned directories are never descended.
 */
class IgnoreWalker {
public:
    using CandidateHandler = std::function<void(const Candidate&)>;
    using ErrorHandler = std::function<void(const std::string&)>;
    using DirectoryPruner = std::function<bool(const std::string& relative_dir)>;

    /**
     * @brief Construct a walker for a root
     * @param root Canonical path of a directory or a single file
     * @param options Ignore source and traversal switches
     */
    IgnoreWalker(const std::filesystem::path& root, const WalkOptions& options);

    /**
     * @brief Skip directories for which the predicate returns true
     */
    void setDirectoryPruner(DirectoryPruner pruner);

    /**
     * @brief Receive a message for every unreadable directory or symlink loop
     */
    void setErrorHandler(ErrorHandler handler);

    /**
     * @brief Walk the root, calling the handler for every visible file
     * @return Number of walk errors encountered
     */
    size_t walk(const CandidateHandler& on_candidate);

    /**
     * @brief Locate the user's global git excludes file
     * @return Empty path when git has none configured and the default is absent
     */
    static std::filesystem::path findGlobalExcludesFile();

    /**
     * @brief Find the closest directory at or above start that holds `.git`
     * @return Empty path when start is not inside a git repository
     */
    static std::filesystem::path findRepositoryRoot(const std::filesystem::path& start);

private:
    /**
     * @brief Ignore files of one directory
     */
    struct Scope {
        IgnorePatternSet ignore_file;
        IgnorePatternSet gitignore;

        explicit Scope(const std::filesystem::path& dir) : ignore_file(dir), gitignore(dir) {}
        bool empty() const { return ignore_file.empty() && gitignore.empty(); }
    };

    std::filesystem::path m_root;
    WalkOptions m_options;
    DirectoryPruner m_pruner;
    ErrorHandler m_error_handler;

    std::vector<Scope> m_scopes;            ///< Shallowest first
    IgnorePatternSet m_git_exclude;
    IgnorePatternSet m_global_excludes;
    std::vector<std::filesystem::path> m_ancestors;
    size_t m_error_count;

    void loadRepositoryIgnores();
    bool pushScope(const std::filesystem::path& dir, bool load_gitignore = true);

    void walkDirectory(const std::filesystem::path& dir, const std::string& relative_dir,
                       const CandidateHandler& on_candidate);

    /**
     * @brief Combine every active ignore source for one entry
     *
     * .ignore rules beat .gitignore rules, which beat .git/info/exclude,
     * which beats the global excludes file. Within a source the deepest
     * directory with a matching rule decides.
     */
    IgnoreMatch evaluate(const std::filesystem::path& path, bool is_directory) const;

    void reportError(const std::string& message);
};

} // namespace PrintCode
