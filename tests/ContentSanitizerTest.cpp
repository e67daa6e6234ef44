// =================================================================
// tests/ContentSanitizerTest.cpp
// =================================================================
// Unit tests for comment stripping and UTF-8 file reading.

#include "PrintCode/ContentSanitizer.hpp"
#include "PrintCode/FileReader.hpp"
#include "PrintCode/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

class ContentSanitizerTest {
public:
    void testCommentLeaders() {
        std::cout << "Testing comment leader table..." << std::endl;

        assert(PrintCode::ContentSanitizer::commentLeader("py") == "#");
        assert(PrintCode::ContentSanitizer::commentLeader("yml") == "#");
        assert(PrintCode::ContentSanitizer::commentLeader("RS") == "//");
        assert(PrintCode::ContentSanitizer::commentLeader(".cpp") == "//");
        assert(PrintCode::ContentSanitizer::commentLeader("sql") == "--");
        assert(PrintCode::ContentSanitizer::commentLeader("md") == "");
        assert(PrintCode::ContentSanitizer::commentLeader("") == "");

        std::cout << "✓ Comment leader test passed" << std::endl;
    }

    void testInlineCommentsPreserved() {
        std::cout << "Testing full-line comment stripping..." << std::endl;

        std::string content = "# comment\n\nx = 1  # inline\n";
        assert(PrintCode::ContentSanitizer::strip(content, "py") == "x = 1  # inline\n");

        std::string rust = "    // indented comment\nlet s = \"// not a comment\";\n\t\n/// doc\nfn main() {}";
        assert(PrintCode::ContentSanitizer::strip(rust, "rs") ==
               "let s = \"// not a comment\";\nfn main() {}\n");

        std::string sql = "-- header\nSELECT 1; -- trailing\n";
        assert(PrintCode::ContentSanitizer::strip(sql, "sql") == "SELECT 1; -- trailing\n");

        std::cout << "✓ Inline comment test passed" << std::endl;
    }

    void testBlankLinesWithoutLeader() {
        std::cout << "Testing blank-line removal for unknown extensions..." << std::endl;

        std::string content = "# Title\n\n   \ntext  \n";
        assert(PrintCode::ContentSanitizer::strip(content, "md") == "# Title\ntext  \n" &&
               "Only blank lines go when the extension has no leader");

        std::cout << "✓ Blank line test passed" << std::endl;
    }

    void testLineEndings() {
        std::cout << "Testing CRLF handling..." << std::endl;

        std::string content = "# c\r\nvalue = 2\r\n\r\n";
        assert(PrintCode::ContentSanitizer::strip(content, "py") == "value = 2\n");
        assert(PrintCode::ContentSanitizer::strip("", "py").empty());
        assert(PrintCode::ContentSanitizer::strip("\n\n# only\n", "py").empty());

        std::cout << "✓ Line ending test passed" << std::endl;
    }

    void testUnicodeWhitespace() {
        std::cout << "Testing Unicode whitespace before comments..." << std::endl;

        // NBSP before a comment, an ideographic-space-only line
        std::string content = "\xC2\xA0# c\n\xE3\x80\x80\nx\n";
        assert(PrintCode::ContentSanitizer::strip(content, "py") == "x\n");

        // Em space and narrow no-break space
        std::string rust = "\xE2\x80\x83// doc\n\xE2\x80\xAF\nlet y = 1;\n";
        assert(PrintCode::ContentSanitizer::strip(rust, "rs") == "let y = 1;\n");

        // Other multibyte text is not whitespace
        std::string kept = "\xC3\xA9t\xC3\xA9\n";
        assert(PrintCode::ContentSanitizer::strip(kept, "py") == kept);

        std::cout << "✓ Unicode whitespace test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ContentSanitizer unit tests..." << std::endl;

        testCommentLeaders();
        testInlineCommentsPreserved();
        testBlankLinesWithoutLeader();
        testLineEndings();
        testUnicodeWhitespace();

        std::cout << "All ContentSanitizer tests passed!" << std::endl;
    }
};

class FileReaderTest {
private:
    fs::path test_dir;

    fs::path writeBytes(const std::string& name, const std::string& bytes) {
        fs::path path = test_dir / name;
        std::ofstream(path, std::ios::binary) << bytes;
        return path;
    }

    bool readFails(const fs::path& path) {
        try {
            PrintCode::FileReader::readText(path);
        } catch (const PrintCode::ReadError&) {
            return true;
        }
        return false;
    }

public:
    FileReaderTest()
        : test_dir(fs::temp_directory_path() / ("printcode_reader_test_" + std::to_string(getpid())))
    {
        fs::create_directories(test_dir);
    }

    ~FileReaderTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testUtf8Validation() {
        std::cout << "Testing UTF-8 validation..." << std::endl;

        assert(PrintCode::FileReader::isValidUtf8(""));
        assert(PrintCode::FileReader::isValidUtf8("plain ascii"));
        assert(PrintCode::FileReader::isValidUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"));
        assert(!PrintCode::FileReader::isValidUtf8("\xFF\xFE"));
        assert(!PrintCode::FileReader::isValidUtf8("\xC3"));
        assert(!PrintCode::FileReader::isValidUtf8("\xC0\xAF") && "Overlong encodings are rejected");
        assert(!PrintCode::FileReader::isValidUtf8("\xED\xA0\x80") && "Surrogates are rejected");

        std::cout << "✓ UTF-8 validation test passed" << std::endl;
    }

    void testReadText() {
        std::cout << "Testing file reading..." << std::endl;

        std::string content = "line one\r\nline two\n\xE2\x9C\x93";
        fs::path path = writeBytes("ok.py", content);
        assert(PrintCode::FileReader::readText(path) == content && "Bytes are returned unchanged");

        fs::path empty = writeBytes("empty.py", "");
        assert(PrintCode::FileReader::readText(empty).empty());

        assert(readFails(writeBytes("binary.py", std::string("\x00\xFF\x10", 3))));
        assert(readFails(test_dir / "missing.py"));

        std::cout << "✓ File reading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running FileReader unit tests..." << std::endl;

        testUtf8Validation();
        testReadText();

        std::cout << "All FileReader tests passed!" << std::endl;
    }
};

int main() {
    try {
        ContentSanitizerTest sanitizer_tests;
        sanitizer_tests.runAllTests();

        std::cout << std::endl;

        FileReaderTest reader_tests;
        reader_tests.runAllTests();

        std::cout << "\n🎉 All content handling tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
