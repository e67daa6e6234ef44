// =================================================================
// include/PrintCode/FileReader.hpp
// =================================================================
// Header for reading accepted files as UTF-8 text.

#pragma once

#include <string>
#include <filesystem>

namespace PrintCode {

class FileReader {
public:
    /**
     * @brief Read a whole file
     * @param path File to read
     * @return Exact file bytes
     * @throws ReadError if the file cannot be opened or read, or if its
     *         content is not valid UTF-8
     */
    static std::string readText(const std::filesystem::path& path);

    /**
     * @brief Check that a byte string is well-formed UTF-8
     *
     * Rejects overlong forms, surrogates and code points above U+10FFFF.
     */
    static bool isValidUtf8(const std::string& bytes);
};

} // namespace PrintCode
