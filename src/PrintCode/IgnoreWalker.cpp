// =================================================================
// src/PrintCode/IgnoreWalker.cpp
// =================================================================
// Implementation for ignore-aware directory traversal.

#include "PrintCode/IgnoreWalker.hpp"
#include "PrintCode/Logger.hpp"
#include "PrintCode/StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace PrintCode {

namespace {

fs::path homeDirectory() {
    const char* home = std::getenv("HOME");
    return (home && *home) ? fs::path(home) : fs::path();
}

fs::path xdgConfigDirectory() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    fs::path home = homeDirectory();
    return home.empty() ? fs::path() : home / ".config";
}

fs::path expandTilde(const std::string& value) {
    if (value.size() >= 2 && value[0] == '~' && value[1] == '/') {
        return homeDirectory() / value.substr(2);
    }
    return fs::path(value);
}

// Value of core.excludesFile in one git config file, or empty
std::string readExcludesFileSetting(const fs::path& config_path) {
    std::ifstream config(config_path);
    if (!config.is_open()) {
        return "";
    }

    std::string value;
    std::string section;
    std::string line;
    while (std::getline(config, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            continue;
        }
        if (trimmed[0] == '[') {
            size_t close = trimmed.find(']');
            section = toLower(trim(trimmed.substr(1, close == std::string::npos ? std::string::npos : close - 1)));
            continue;
        }
        if (section != "core") {
            continue;
        }
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (toLower(trim(trimmed.substr(0, eq))) != "excludesfile") {
            continue;
        }
        value = trim(trimmed.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
    return value;
}

bool isHidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

} // namespace

IgnoreWalker::IgnoreWalker(const fs::path& root, const WalkOptions& options)
    : m_root(root),
      m_options(options),
      m_error_count(0)
{
}

void IgnoreWalker::setDirectoryPruner(DirectoryPruner pruner) {
    m_pruner = std::move(pruner);
}

void IgnoreWalker::setErrorHandler(ErrorHandler handler) {
    m_error_handler = std::move(handler);
}

size_t IgnoreWalker::walk(const CandidateHandler& on_candidate) {
    m_error_count = 0;
    m_scopes.clear();
    m_ancestors.clear();

    std::error_code ec;
    fs::file_status status = fs::status(m_root, ec);
    if (ec) {
        reportError(toSlashPath(m_root) + ": " + ec.message());
        return m_error_count;
    }

    // An explicitly named file is always yielded
    if (fs::is_regular_file(status)) {
        Candidate candidate;
        candidate.absolute_path = m_root;
        candidate.file_name = m_root.filename().string();
        candidate.relative_path = candidate.file_name;
        on_candidate(candidate);
        return m_error_count;
    }

    if (!fs::is_directory(status)) {
        PC_LOG_DEBUG("IgnoreWalker", "Root is neither a file nor a directory: " + toSlashPath(m_root));
        return m_error_count;
    }

    loadRepositoryIgnores();

    m_ancestors.push_back(m_root);
    walkDirectory(m_root, "", on_candidate);
    m_ancestors.pop_back();

    return m_error_count;
}

fs::path IgnoreWalker::findGlobalExcludesFile() {
    // Later files override earlier ones, as in git
    std::string configured;
    fs::path xdg = xdgConfigDirectory();
    if (!xdg.empty()) {
        std::string value = readExcludesFileSetting(xdg / "git" / "config");
        if (!value.empty()) {
            configured = value;
        }
    }
    fs::path home = homeDirectory();
    if (!home.empty()) {
        std::string value = readExcludesFileSetting(home / ".gitconfig");
        if (!value.empty()) {
            configured = value;
        }
    }

    if (!configured.empty()) {
        return expandTilde(configured);
    }

    if (!xdg.empty()) {
        fs::path fallback = xdg / "git" / "ignore";
        std::error_code ec;
        if (fs::is_regular_file(fallback, ec)) {
            return fallback;
        }
    }
    return fs::path();
}

fs::path IgnoreWalker::findRepositoryRoot(const fs::path& start) {
    std::error_code ec;
    for (fs::path dir = start; !dir.empty(); dir = dir.parent_path()) {
        if (fs::exists(dir / ".git", ec)) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }
    return fs::path();
}

void IgnoreWalker::loadRepositoryIgnores() {
    m_git_exclude = IgnorePatternSet();
    m_global_excludes = IgnorePatternSet();

    if (!m_options.anyIgnoreSource()) {
        return;
    }

    fs::path repo_root = findRepositoryRoot(m_root);

    // Ignore files above the root still apply. .ignore files count up to the
    // filesystem root, .gitignore files stop at the enclosing repository root.
    std::vector<fs::path> parents;
    for (fs::path dir = m_root; dir.has_relative_path(); ) {
        dir = dir.parent_path();
        parents.push_back(dir);
    }
    std::reverse(parents.begin(), parents.end());
    for (const auto& dir : parents) {
        bool inside_repository = repo_root.empty() ||
                                 dir.native().size() >= repo_root.native().size();
        pushScope(dir, inside_repository);
    }

    fs::path base = repo_root.empty() ? m_root : repo_root;

    if (m_options.respect_gitignore && !repo_root.empty()) {
        m_git_exclude = IgnorePatternSet(repo_root);
        size_t loaded = m_git_exclude.loadFromFile(repo_root / ".git" / "info" / "exclude");
        if (loaded > 0) {
            Logger::getInstance().debug("IgnoreWalker", "Loaded .git/info/exclude",
                                        std::to_string(loaded) + " patterns");
        }
    }

    if (m_options.respect_global_excludes) {
        fs::path global_file = findGlobalExcludesFile();
        if (!global_file.empty()) {
            m_global_excludes = IgnorePatternSet(base);
            size_t loaded = m_global_excludes.loadFromFile(global_file);
            if (loaded > 0) {
                Logger::getInstance().debug("IgnoreWalker", "Loaded global excludes",
                                            toSlashPath(global_file) + ", " + std::to_string(loaded) + " patterns");
            }
        }
    }
}

bool IgnoreWalker::pushScope(const fs::path& dir, bool load_gitignore) {
    Scope scope(dir);
    if (m_options.respect_ignore_files) {
        scope.ignore_file.loadFromFile(dir / ".ignore");
    }
    if (m_options.respect_gitignore && load_gitignore) {
        scope.gitignore.loadFromFile(dir / ".gitignore");
    }
    if (scope.empty()) {
        return false;
    }
    m_scopes.push_back(std::move(scope));
    return true;
}

void IgnoreWalker::walkDirectory(const fs::path& dir, const std::string& relative_dir,
                                 const CandidateHandler& on_candidate) {
    bool pushed = m_options.anyIgnoreSource() && pushScope(dir);

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        reportError(toSlashPath(dir) + ": " + ec.message());
    } else {
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            reportError(toSlashPath(dir) + ": " + ec.message());
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().native() < b.path().filename().native();
              });

    for (const auto& entry : entries) {
        const fs::path& path = entry.path();
        std::string name = path.filename().string();
        std::string relative = relative_dir.empty() ? name : relative_dir + "/" + name;

        std::error_code status_ec;
        bool is_symlink = entry.is_symlink(status_ec);
        if (is_symlink && !m_options.follow_symlinks) {
            continue;
        }

        fs::file_status status = entry.status(status_ec);
        if (status_ec) {
            // Dangling symlink or an entry removed since listing
            PC_LOG_DEBUG("IgnoreWalker", "Cannot stat " + relative + ": " + status_ec.message());
            continue;
        }

        bool is_directory = fs::is_directory(status);
        if (is_directory && name == ".git") {
            continue;
        }

        IgnoreMatch verdict = evaluate(path, is_directory);
        if (verdict == IgnoreMatch::Ignore) {
            PC_LOG_DEBUG("IgnoreWalker", "Ignored by rules: " + relative);
            continue;
        }
        if (verdict == IgnoreMatch::None && !m_options.include_hidden && isHidden(name)) {
            continue;
        }

        if (is_directory) {
            if (m_pruner && m_pruner(relative)) {
                PC_LOG_DEBUG("IgnoreWalker", "Pruned directory: " + relative);
                continue;
            }

            fs::path resolved = path;
            if (is_symlink) {
                std::error_code canon_ec;
                resolved = fs::canonical(path, canon_ec);
                if (canon_ec) {
                    reportError(relative + ": " + canon_ec.message());
                    continue;
                }
                if (std::find(m_ancestors.begin(), m_ancestors.end(), resolved) != m_ancestors.end()) {
                    reportError("File system loop found: " + relative + " points to an ancestor " +
                                toSlashPath(resolved));
                    continue;
                }
            }

            m_ancestors.push_back(resolved);
            walkDirectory(path, relative, on_candidate);
            m_ancestors.pop_back();
        } else if (fs::is_regular_file(status)) {
            Candidate candidate;
            candidate.absolute_path = path;
            candidate.relative_path = relative;
            candidate.file_name = name;
            on_candidate(candidate);
        }
    }

    if (pushed) {
        m_scopes.pop_back();
    }
}

IgnoreMatch IgnoreWalker::evaluate(const fs::path& path, bool is_directory) const {
    if (!m_options.anyIgnoreSource()) {
        return IgnoreMatch::None;
    }

    for (auto it = m_scopes.rbegin(); it != m_scopes.rend(); ++it) {
        IgnoreMatch m = it->ignore_file.match(path, is_directory);
        if (m != IgnoreMatch::None) {
            return m;
        }
    }

    for (auto it = m_scopes.rbegin(); it != m_scopes.rend(); ++it) {
        IgnoreMatch m = it->gitignore.match(path, is_directory);
        if (m != IgnoreMatch::None) {
            return m;
        }
    }

    IgnoreMatch m = m_git_exclude.match(path, is_directory);
    if (m != IgnoreMatch::None) {
        return m;
    }

    return m_global_excludes.match(path, is_directory);
}

void IgnoreWalker::reportError(const std::string& message) {
    ++m_error_count;
    PC_LOG_DEBUG("IgnoreWalker", "Walk error: " + message);
    if (m_error_handler) {
        m_error_handler(message);
    }
}

} // namespace PrintCode
