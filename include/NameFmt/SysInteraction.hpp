// =================================================================
// include/NameFmt/SysInteraction.hpp
// =================================================================
// Defines the interface for filesystem operations used by the
// config loader and the renamer.

#pragma once

#include <string>

namespace NameFmt {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Checks if anything exists at the path.
     */
    bool pathExists(const std::string& path);

    /**
     * @brief Creates a directory and any missing parents.
     * @param dir_path Directory to create.
     * @param error_message Receives the reason on failure.
     * @return True if the directory exists afterwards.
     */
    bool createDirectories(const std::string& dir_path, std::string& error_message);

    /**
     * @brief Renames a file.
     * Throws std::filesystem::filesystem_error on failure.
     */
    void renamePath(const std::string& from, const std::string& to);
};

} // namespace NameFmt
