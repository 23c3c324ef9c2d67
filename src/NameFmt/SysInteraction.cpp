// =================================================================
// src/NameFmt/SysInteraction.cpp
// =================================================================
// Implementation for filesystem operations.

#include "NameFmt/SysInteraction.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <sys/stat.h>

namespace NameFmt {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool SysInteraction::pathExists(const std::string& path) {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

bool SysInteraction::createDirectories(const std::string& dir_path, std::string& error_message) {
    if (dir_path.empty() || directoryExists(dir_path)) {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    if (ec) {
        error_message = ec.message();
        return false;
    }
    return true;
}

void SysInteraction::renamePath(const std::string& from, const std::string& to) {
    std::filesystem::rename(from, to);
}

} // namespace NameFmt
