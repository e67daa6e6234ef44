// =================================================================
// tests/IgnoreWalkerTest.cpp
// =================================================================
// Unit tests for the ignore-aware directory walker.

#include "PrintCode/IgnoreWalker.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <algorithm>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

class IgnoreWalkerTest {
private:
    fs::path test_dir;

    void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    void resetTree() {
        cleanup();
        fs::create_directories(test_dir);
    }

    void cleanup() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    PrintCode::WalkOptions localOptions() {
        // User-level excludes would make results depend on the machine
        PrintCode::WalkOptions options;
        options.respect_global_excludes = false;
        return options;
    }

    std::vector<std::string> collect(PrintCode::IgnoreWalker& walker, size_t* errors = nullptr) {
        std::vector<std::string> paths;
        size_t error_count = walker.walk([&paths](const PrintCode::Candidate& candidate) {
            paths.push_back(candidate.relative_path);
        });
        if (errors) {
            *errors = error_count;
        }
        return paths;
    }

    std::vector<std::string> collect(const fs::path& root, const PrintCode::WalkOptions& options) {
        PrintCode::IgnoreWalker walker(root, options);
        return collect(walker);
    }

    bool contains(const std::vector<std::string>& paths, const std::string& path) {
        return std::find(paths.begin(), paths.end(), path) != paths.end();
    }

public:
    IgnoreWalkerTest()
        : test_dir(fs::canonical(fs::temp_directory_path()) / ("printcode_walker_test_" + std::to_string(getpid())))
    {
    }

    ~IgnoreWalkerTest() {
        cleanup();
    }

    void testNestedGitignoreScopes() {
        std::cout << "Testing nested .gitignore scoping..." << std::endl;

        resetTree();
        writeFile(test_dir / ".gitignore", "*.log\n");
        writeFile(test_dir / "a.py", "print('a')\n");
        writeFile(test_dir / "x.log", "log\n");
        writeFile(test_dir / "sub" / ".gitignore", "!keep.log\n/local.py\n");
        writeFile(test_dir / "sub" / "keep.log", "kept\n");
        writeFile(test_dir / "sub" / "local.py", "hidden by sub\n");
        writeFile(test_dir / "other" / "local.py", "visible\n");

        std::vector<std::string> paths = collect(test_dir, localOptions());

        std::vector<std::string> expected = {"a.py", "other/local.py", "sub/keep.log"};
        assert(paths == expected && "Deeper rules override shallower ones only in their subtree");

        std::cout << "✓ Nested .gitignore test passed" << std::endl;
    }

    void testIgnoreFilePrecedence() {
        std::cout << "Testing .ignore precedence over .gitignore..." << std::endl;

        resetTree();
        writeFile(test_dir / ".ignore", "!readme.txt\n");
        writeFile(test_dir / "docs" / ".gitignore", "*.txt\n");
        writeFile(test_dir / "docs" / "readme.txt", "read me\n");
        writeFile(test_dir / "docs" / "notes.txt", "notes\n");

        std::vector<std::string> paths = collect(test_dir, localOptions());
        assert(contains(paths, "docs/readme.txt") && ".ignore rules win over any .gitignore rule");
        assert(!contains(paths, "docs/notes.txt"));

        PrintCode::WalkOptions git_only = localOptions();
        git_only.respect_ignore_files = false;
        paths = collect(test_dir, git_only);
        assert(!contains(paths, "docs/readme.txt") && "Without .ignore files the .gitignore rule applies");

        std::cout << "✓ .ignore precedence test passed" << std::endl;
    }

    void testIgnoreSourcesDisabled() {
        std::cout << "Testing traversal with every ignore source disabled..." << std::endl;

        resetTree();
        writeFile(test_dir / ".gitignore", "*.log\nbuild/\n");
        writeFile(test_dir / "x.log", "log\n");
        writeFile(test_dir / "build" / "out.py", "generated\n");
        writeFile(test_dir / "main.py", "main\n");

        PrintCode::WalkOptions options;
        options.respect_gitignore = false;
        options.respect_ignore_files = false;
        options.respect_global_excludes = false;
        assert(!options.anyIgnoreSource());

        std::vector<std::string> paths = collect(test_dir, options);
        std::vector<std::string> expected = {"build/out.py", "main.py", "x.log"};
        assert(paths == expected);

        std::cout << "✓ Disabled ignore sources test passed" << std::endl;
    }

    void testHiddenEntries() {
        std::cout << "Testing hidden file handling..." << std::endl;

        resetTree();
        writeFile(test_dir / ".env", "SECRET=1\n");
        writeFile(test_dir / ".config" / "settings.py", "x = 1\n");
        writeFile(test_dir / ".git" / "config", "[core]\n");
        writeFile(test_dir / ".keep", "whitelisted\n");
        writeFile(test_dir / ".gitignore", "!.keep\n");
        writeFile(test_dir / "visible.py", "y = 2\n");

        std::vector<std::string> paths = collect(test_dir, localOptions());
        std::vector<std::string> expected = {".keep", "visible.py"};
        assert(paths == expected && "Hidden entries are skipped unless a rule re-includes them");

        PrintCode::WalkOptions options = localOptions();
        options.include_hidden = true;
        paths = collect(test_dir, options);
        assert(contains(paths, ".env"));
        assert(contains(paths, ".config/settings.py"));
        assert(contains(paths, ".gitignore"));
        assert(!contains(paths, ".git/config") && ".git is never descended");

        std::cout << "✓ Hidden entries test passed" << std::endl;
    }

    void testRepositoryIgnores() {
        std::cout << "Testing ignore files above the root and .git/info/exclude..." << std::endl;

        resetTree();
        writeFile(test_dir / ".git" / "info" / "exclude", "secret.py\n");
        writeFile(test_dir / ".gitignore", "*.gen.py\n");
        writeFile(test_dir / "src" / "model.gen.py", "generated\n");
        writeFile(test_dir / "src" / "secret.py", "secret\n");
        writeFile(test_dir / "src" / "app.py", "app\n");

        assert(PrintCode::IgnoreWalker::findRepositoryRoot(test_dir / "src") == test_dir);

        std::vector<std::string> paths = collect(test_dir / "src", localOptions());
        std::vector<std::string> expected = {"app.py"};
        assert(paths == expected && "Repository rules apply when scanning a subdirectory");

        PrintCode::WalkOptions no_git = localOptions();
        no_git.respect_gitignore = false;
        paths = collect(test_dir / "src", no_git);
        assert(paths.size() == 3);

        std::cout << "✓ Repository ignores test passed" << std::endl;
    }

    void testParentIgnoresWithoutRepository() {
        std::cout << "Testing ignore files above the root outside a repository..." << std::endl;

        resetTree();
        writeFile(test_dir / ".gitignore", "secret.py\n");
        writeFile(test_dir / ".ignore", "gen.py\n");
        writeFile(test_dir / "sub" / "a.py", "a\n");
        writeFile(test_dir / "sub" / "gen.py", "generated\n");
        writeFile(test_dir / "sub" / "secret.py", "secret\n");

        std::vector<std::string> paths = collect(test_dir / "sub", localOptions());
        std::vector<std::string> expected = {"a.py"};
        assert(paths == expected && "Parent .gitignore and .ignore apply without a .git directory");

        // Above a repository only .ignore files still count
        resetTree();
        writeFile(test_dir / ".gitignore", "outside.py\n");
        writeFile(test_dir / ".ignore", "gen.py\n");
        writeFile(test_dir / "repo" / ".git" / "HEAD", "ref: refs/heads/main\n");
        writeFile(test_dir / "repo" / ".gitignore", "inside.py\n");
        writeFile(test_dir / "repo" / "sub" / "a.py", "a\n");
        writeFile(test_dir / "repo" / "sub" / "gen.py", "generated\n");
        writeFile(test_dir / "repo" / "sub" / "inside.py", "ignored\n");
        writeFile(test_dir / "repo" / "sub" / "outside.py", "kept\n");

        paths = collect(test_dir / "repo" / "sub", localOptions());
        expected = {"a.py", "outside.py"};
        assert(paths == expected && ".gitignore files above the repository root are not read");

        std::cout << "✓ Parent ignores test passed" << std::endl;
    }

    void testDirectoryPruner() {
        std::cout << "Testing directory pruning..." << std::endl;

        resetTree();
        writeFile(test_dir / "keep" / "a.py", "a\n");
        writeFile(test_dir / "skip" / "b.py", "b\n");
        writeFile(test_dir / "skip" / "deep" / "c.py", "c\n");

        PrintCode::IgnoreWalker walker(test_dir, localOptions());
        std::vector<std::string> asked;
        walker.setDirectoryPruner([&asked](const std::string& relative_dir) {
            asked.push_back(relative_dir);
            return relative_dir == "skip";
        });

        std::vector<std::string> paths = collect(walker);
        std::vector<std::string> expected = {"keep/a.py"};
        assert(paths == expected);
        assert(!contains(asked, "skip/deep") && "Pruned directories are not entered");

        std::cout << "✓ Directory pruner test passed" << std::endl;
    }

    void testSymlinks() {
        std::cout << "Testing symlink handling and loop detection..." << std::endl;

        resetTree();
        writeFile(test_dir / "real" / "a.py", "a\n");
        fs::create_directory_symlink(test_dir, test_dir / "real" / "loop");
        fs::create_directory_symlink(test_dir / "real", test_dir / "alias");

        std::vector<std::string> paths = collect(test_dir, localOptions());
        std::vector<std::string> expected = {"real/a.py"};
        assert(paths == expected && "Symlinks are skipped unless following");

        PrintCode::WalkOptions options = localOptions();
        options.follow_symlinks = true;
        PrintCode::IgnoreWalker walker(test_dir, options);
        std::vector<std::string> messages;
        walker.setErrorHandler([&messages](const std::string& message) {
            messages.push_back(message);
        });

        size_t errors = 0;
        paths = collect(walker, &errors);

        // Terminates, follows alias, reports each loop
        assert(contains(paths, "real/a.py"));
        assert(contains(paths, "alias/a.py"));
        assert(errors == messages.size());
        assert(errors == 2 && "Both routes into real/loop point back at the root");
        assert(messages[0].find("File system loop") != std::string::npos);

        std::cout << "✓ Symlink test passed" << std::endl;
    }

    void testFileRootAndMissingRoot() {
        std::cout << "Testing file roots and missing roots..." << std::endl;

        resetTree();
        writeFile(test_dir / "single.py", "x\n");

        PrintCode::IgnoreWalker file_walker(test_dir / "single.py", localOptions());
        std::vector<PrintCode::Candidate> candidates;
        file_walker.walk([&candidates](const PrintCode::Candidate& candidate) {
            candidates.push_back(candidate);
        });
        assert(candidates.size() == 1);
        assert(candidates[0].relative_path == "single.py");
        assert(candidates[0].file_name == "single.py");
        assert(candidates[0].absolute_path == test_dir / "single.py");

        PrintCode::IgnoreWalker missing(test_dir / "nope", localOptions());
        size_t errors = 0;
        std::vector<std::string> paths = collect(missing, &errors);
        assert(paths.empty());
        assert(errors == 1);

        std::cout << "✓ File root test passed" << std::endl;
    }

    void testDeterministicOrder() {
        std::cout << "Testing deterministic traversal order..." << std::endl;

        resetTree();
        writeFile(test_dir / "b" / "z.py", "z\n");
        writeFile(test_dir / "b" / "a.py", "a\n");
        writeFile(test_dir / "a.py", "a\n");
        writeFile(test_dir / "C.py", "c\n");

        std::vector<std::string> first = collect(test_dir, localOptions());
        std::vector<std::string> second = collect(test_dir, localOptions());
        assert(first == second);

        std::vector<std::string> expected = {"C.py", "a.py", "b/a.py", "b/z.py"};
        assert(first == expected && "Entries are visited in byte order of their names");

        cleanup();
        std::cout << "✓ Deterministic order test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnoreWalker unit tests..." << std::endl;

        testNestedGitignoreScopes();
        testIgnoreFilePrecedence();
        testIgnoreSourcesDisabled();
        testHiddenEntries();
        testRepositoryIgnores();
        testParentIgnoresWithoutRepository();
        testDirectoryPruner();
        testSymlinks();
        testFileRootAndMissingRoot();
        testDeterministicOrder();

        std::cout << "All IgnoreWalker tests passed!" << std::endl;
    }
};

int main() {
    try {
        IgnoreWalkerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
