// =================================================================
// src/NameFmt/FileScanner.cpp
// =================================================================
// Implementation for candidate file discovery.

#include "NameFmt/FileScanner.hpp"
#include "NameFmt/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace NameFmt {

FileScanner::FileScanner(const std::filesystem::path& root_path)
    : m_root_path(root_path)
{
}

std::vector<std::filesystem::path> FileScanner::scanFiles() const {
    std::vector<std::filesystem::path> discovered_files;

    auto root_status = std::filesystem::status(m_root_path);
    if (std::filesystem::is_regular_file(root_status)) {
        discovered_files.push_back(m_root_path);
    } else if (std::filesystem::is_directory(root_status)) {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(m_root_path)) {
            if (entry.is_symlink() || !entry.is_regular_file()) {
                continue;
            }
            discovered_files.push_back(entry.path());
        }
    } else {
        throw std::runtime_error("Path does not exist: " + m_root_path.string());
    }

    // Sort files for consistent output
    std::sort(discovered_files.begin(), discovered_files.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return a.string() < b.string();
              });

    std::vector<std::string> names;
    names.reserve(discovered_files.size());
    for (const auto& file : discovered_files) {
        names.push_back(file.string());
    }
    Logger::getInstance().logScanResults(m_root_path.string(), names);

    return discovered_files;
}

} // namespace NameFmt
