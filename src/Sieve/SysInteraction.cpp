// =================================================================
// src/Sieve/SysInteraction.cpp
// =================================================================
// Implementation for file-system operations.

#include "Sieve/SysInteraction.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace Sieve {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool SysInteraction::createDirectory(const std::string& dir_path) {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

bool SysInteraction::readTextFile(const std::string& file_path, size_t max_bytes, std::string& content) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size > max_bytes) {
        return false;
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return false;
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    std::string text = buffer.str();

    // A NUL byte in the first block marks a binary file
    if (text.substr(0, 8000).find('\0') != std::string::npos) {
        return false;
    }
    content = std::move(text);
    return true;
}

} // namespace Sieve
