// =================================================================
// tests/IgnorePatternTest.cpp
// =================================================================
// Unit tests for gitignore-style pattern parsing and matching.

#include "PrintCode/IgnorePattern.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <unistd.h>

namespace fs = std::filesystem;

class IgnorePatternTest {
public:
    void testBasicMatching() {
        std::cout << "Testing basic pattern matching..." << std::endl;

        PrintCode::IgnorePattern pattern("*.log");

        assert(pattern.matches("debug.log") && "Should match *.log pattern");
        assert(!pattern.matches("debug.txt") && "Should not match other extensions");
        assert(pattern.matches("logs/app/debug.log") && "Unanchored patterns match at any depth");
        assert(!pattern.isAnchored());

        PrintCode::IgnorePattern name("b.py");
        assert(name.matches("b.py"));
        assert(name.matches("pkg/b.py"));
        assert(!name.matches("ab.py"));

        std::cout << "✓ Basic matching test passed" << std::endl;
    }

    void testDirectoryOnly() {
        std::cout << "Testing directory-only patterns..." << std::endl;

        PrintCode::IgnorePattern pattern("build/");

        assert(pattern.isDirectoryOnly());
        assert(pattern.matches("build", true) && "Should match the directory itself");
        assert(pattern.matches("src/build", true) && "Should match nested directories");
        assert(!pattern.matches("build", false) && "Should not match a file named build");
        assert(!pattern.matches("buildfile.txt"));

        std::cout << "✓ Directory-only test passed" << std::endl;
    }

    void testAnchoring() {
        std::cout << "Testing anchored patterns..." << std::endl;

        PrintCode::IgnorePattern rooted("/config.py");
        assert(rooted.isAnchored());
        assert(rooted.matches("config.py"));
        assert(!rooted.matches("app/config.py") && "A leading slash anchors to the base");

        PrintCode::IgnorePattern inner("docs/*.md");
        assert(inner.isAnchored());
        assert(inner.matches("docs/intro.md"));
        assert(!inner.matches("docs/sub/intro.md") && "* does not cross directories");
        assert(!inner.matches("other/docs/intro.md"));

        PrintCode::IgnorePattern deep("**/cache");
        assert(deep.matches("cache"));
        assert(deep.matches("a/b/cache"));

        PrintCode::IgnorePattern below("logs/**");
        assert(below.matches("logs/2024/app.log"));
        assert(!below.matches("src/logs/app.log"));

        std::cout << "✓ Anchoring test passed" << std::endl;
    }

    void testParsingRules() {
        std::cout << "Testing comment, blank and escape handling..." << std::endl;

        assert(PrintCode::IgnorePattern("").isEmpty());
        assert(PrintCode::IgnorePattern("# comment").isEmpty());
        assert(PrintCode::IgnorePattern("   ").isEmpty());
        assert(PrintCode::IgnorePattern("\r").isEmpty());

        PrintCode::IgnorePattern hash("\\#notes.txt");
        assert(!hash.isEmpty());
        assert(hash.matches("#notes.txt"));

        PrintCode::IgnorePattern bang("\\!keep.txt");
        assert(!bang.isNegation());
        assert(bang.matches("!keep.txt"));

        PrintCode::IgnorePattern trailing("temp.txt   ");
        assert(trailing.matches("temp.txt") && "Unescaped trailing spaces are ignored");

        PrintCode::IgnorePattern crlf("crlf.txt\r");
        assert(crlf.matches("crlf.txt"));

        PrintCode::IgnorePattern bracket("odd[name");
        assert(bracket.matches("odd[name") && "An unclosed bracket is literal");

        std::cout << "✓ Parsing rules test passed" << std::endl;
    }

    void testNegation() {
        std::cout << "Testing negation patterns..." << std::endl;

        PrintCode::IgnorePattern pattern("!important.log");
        assert(pattern.isNegation());
        assert(pattern.matches("important.log") && "Negations match what they re-include");
        assert(!pattern.matches("other.log"));

        std::cout << "✓ Negation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;

        testBasicMatching();
        testDirectoryOnly();
        testAnchoring();
        testParsingRules();
        testNegation();

        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

class IgnorePatternSetTest {
private:
    fs::path test_dir;

public:
    IgnorePatternSetTest()
        : test_dir(fs::temp_directory_path() / ("printcode_ignore_set_" + std::to_string(getpid())))
    {
    }

    void testLastMatchWins() {
        std::cout << "Testing last matching rule wins..." << std::endl;

        PrintCode::IgnorePatternSet set("/project");
        set.addPattern("*.log");
        set.addPattern("!keep.log");
        set.addPattern("# not a rule");

        assert(set.size() == 2 && "Comments are not stored");
        assert(set.matchRelative("debug.log", false) == PrintCode::IgnoreMatch::Ignore);
        assert(set.matchRelative("keep.log", false) == PrintCode::IgnoreMatch::Whitelist);
        assert(set.matchRelative("main.py", false) == PrintCode::IgnoreMatch::None);

        set.addPattern("keep.log");
        assert(set.matchRelative("keep.log", false) == PrintCode::IgnoreMatch::Ignore);

        std::cout << "✓ Last match test passed" << std::endl;
    }

    void testScopedMatching() {
        std::cout << "Testing matching relative to the base directory..." << std::endl;

        PrintCode::IgnorePatternSet set("/project/sub");
        set.addPattern("/local.py");

        assert(set.shouldIgnore("/project/sub/local.py"));
        assert(!set.shouldIgnore("/project/sub/deeper/local.py"));
        assert(!set.shouldIgnore("/project/local.py") && "Paths outside the base are never matched");
        assert(!set.shouldIgnore("/project/sub") && "The base itself is never matched");

        std::cout << "✓ Scoped matching test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing loading rules from a file..." << std::endl;

        fs::create_directories(test_dir);
        fs::path file = test_dir / ".gitignore";
        {
            std::ofstream out(file);
            out << "# build output\n"
                << "\n"
                << "build/\r\n"
                << "*.tmp\n"
                << "!wanted.tmp\n";
        }

        PrintCode::IgnorePatternSet set(test_dir);
        assert(set.loadFromFile(file) == 3);
        assert(set.shouldIgnore(test_dir / "build", true));
        assert(!set.shouldIgnore(test_dir / "build", false));
        assert(set.shouldIgnore(test_dir / "a" / "x.tmp"));
        assert(set.match(test_dir / "wanted.tmp", false) == PrintCode::IgnoreMatch::Whitelist);

        PrintCode::IgnorePatternSet missing(test_dir);
        assert(missing.loadFromFile(test_dir / "does-not-exist") == 0);
        assert(missing.empty());

        fs::remove_all(test_dir);
        std::cout << "✓ Load from file test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePatternSet unit tests..." << std::endl;

        testLastMatchWins();
        testScopedMatching();
        testLoadFromFile();

        std::cout << "All IgnorePatternSet tests passed!" << std::endl;
    }
};

int main() {
    try {
        IgnorePatternTest pattern_tests;
        pattern_tests.runAllTests();

        std::cout << std::endl;

        IgnorePatternSetTest set_tests;
        set_tests.runAllTests();

        std::cout << "\n🎉 All ignore pattern tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
