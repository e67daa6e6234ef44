// =================================================================
// src/PrintCode/FileReader.cpp
// =================================================================
// Implementation for reading files as validated UTF-8 text.

#include "PrintCode/FileReader.hpp"
#include "PrintCode/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace PrintCode {

std::string FileReader::readText(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError(std::string("Failed to open file: ") + std::strerror(errno));
    }

    std::ostringstream content_stream;
    content_stream << file.rdbuf();
    if (file.bad()) {
        throw ReadError("Failed to read file");
    }

    std::string content = content_stream.str();
    if (!isValidUtf8(content)) {
        throw ReadError("invalid UTF-8 content");
    }
    return content;
}

bool FileReader::isValidUtf8(const std::string& bytes) {
    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t length;
        unsigned int code_point;
        if (c >= 0xC2 && c <= 0xDF) {
            length = 2;
            code_point = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            length = 3;
            code_point = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            length = 4;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + length > n) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        if ((length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace PrintCode
