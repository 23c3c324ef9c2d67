// =================================================================
// include/NameFmt/FileScanner.hpp
// =================================================================
// Header for discovering the files a run should consider.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace NameFmt {

/**
 * @brief Collects candidate files beneath a root path
 *
 * A regular file root yields itself. A directory root yields every
 * regular file below it, recursively. Symbolic links are neither
 * followed nor reported. The result is sorted by path so that
 * output is reproducible, and it is collected in full before any
 * file is renamed.
 */
class FileScanner {
public:
    /**
     * @brief Construct a new FileScanner
     * @param root_path File or directory to scan
     */
    explicit FileScanner(const std::filesystem::path& root_path);

    /**
     * @brief Scan the root and return candidate files
     * @return Sorted candidate paths, prefixed with the root as given
     *
     * Throws std::runtime_error if the root does not exist and
     * std::filesystem::filesystem_error if the walk fails.
     */
    std::vector<std::filesystem::path> scanFiles() const;

private:
    std::filesystem::path m_root_path;
};

} // namespace NameFmt
