// =================================================================
// include/NameFmt/NameTransformer.hpp
// =================================================================
// Decides whether a file name should change and what it becomes.

#pragma once

#include "NameFmt/Config.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace NameFmt {

/**
 * @brief Computes new file names from a resolved configuration
 *
 * Decision order for a name:
 * 1. Executables and files inside package roots become kebab-case.
 * 2. Otherwise the first behavior whose pattern matches applies its style.
 * 3. Otherwise spaces are replaced by underscores if enabled.
 * 4. A YYYY_MM_DD__ prefix is prepended when a timestamp is requested.
 */
class NameTransformer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @brief Construct a transformer
     * @param config Configuration, must outlive the transformer
     * @param clock Time source for the timestamp prefix (default: system clock),
     *              read once here so every name of a run gets the same date
     */
    explicit NameTransformer(const FormatConfig& config, Clock clock = nullptr);

    /**
     * @brief Compute the new base name for a file
     * @param name Base name of the file
     * @param path Full path of the file, used for detection
     * @param timestamp Prepend the UTC date taken at construction
     * @return The new name, or std::nullopt if it equals the original
     */
    std::optional<std::string> formatFilename(const std::string& name,
                                              const std::filesystem::path& path,
                                              bool timestamp) const;

    /**
     * @brief Check whether a path is an executable or belongs to a package root
     */
    bool isExeOrPackage(const std::filesystem::path& path) const;

    /**
     * @brief Minimal glob match supporting at most one '*'
     *
     * Without '*' the pattern is a substring test. With one '*' the name
     * must start with the part before it and end with the part after it.
     * Patterns with more than one '*' never match.
     */
    static bool matchesPattern(const std::string& name, const std::string& pattern);

    /**
     * @brief Format the date prefix for a point in time
     * @return "YYYY_MM_DD__" for the UTC calendar date of time_point
     */
    static std::string timestampPrefix(const std::chrono::system_clock::time_point& time_point);

    static bool isExeOrPackage(const std::filesystem::path& path, const DetectionRules& rules);

private:
    const FormatConfig& m_config;
    std::string m_timestamp_prefix;
};

} // namespace NameFmt
