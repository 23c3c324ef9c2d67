// =================================================================
// include/NameFmt/Renamer.hpp
// =================================================================
// Applies or previews renames for every candidate file of a run.

#pragma once

#include "NameFmt/Config.hpp"
#include "NameFmt/NameTransformer.hpp"
#include "NameFmt/SysInteraction.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace NameFmt {

/**
 * @brief What to do when a rename fails
 */
enum class ErrorPolicy {
    Abort,      ///< Stop at the first failure and propagate it
    Continue    ///< Record the failure and process the remaining files
};

/**
 * @brief Options controlling a rename run
 */
struct RenameOptions {
    bool inplace = false;                       ///< Perform renames instead of a dry run
    bool timestamp = false;                     ///< Prefix YYYY_MM_DD__ to every name
    ErrorPolicy error_policy = ErrorPolicy::Abort;
};

/**
 * @brief A single planned or performed rename
 */
struct RenameOperation {
    std::filesystem::path old_path;
    std::filesystem::path new_path;
    bool applied = false;
};

/**
 * @brief Outcome of a run
 */
struct RenameSummary {
    size_t candidates = 0;
    std::vector<RenameOperation> operations;
    std::vector<std::pair<std::string, std::string>> failures; ///< (path, error message)

    size_t appliedCount() const;
    bool success() const { return failures.empty(); }
};

/**
 * @brief Drives the per-file formatting of a run
 *
 * Each changed file produces one line on the output stream:
 * "Renamed: <old> -> <new>" when renaming in place, or
 * "Would rename: <old> -> <new>" in dry-run mode. All new names are
 * computed before the first rename, then applied in scan order.
 */
class Renamer {
public:
    /**
     * @brief Construct a renamer
     * @param config Resolved configuration, must outlive the renamer
     * @param options Run options
     * @param out Stream receiving the rename report
     * @param clock Time source for timestamp prefixes (default: system clock)
     */
    Renamer(const FormatConfig& config, const RenameOptions& options,
            std::ostream& out = std::cout, NameTransformer::Clock clock = nullptr);

    /**
     * @brief Process a file or every file beneath a directory
     * @param path Root path of the run
     * @return Summary of the run
     *
     * Throws std::runtime_error if the path does not exist, and
     * std::filesystem::filesystem_error on traversal failures or, under
     * ErrorPolicy::Abort, on the first failed rename.
     */
    RenameSummary processPath(const std::filesystem::path& path);

    /**
     * @brief Compute the rename for a single file without touching it
     * @param file_path Path of the file
     * @return The planned rename, or std::nullopt if the name is unchanged
     */
    std::optional<RenameOperation> planFile(const std::filesystem::path& file_path) const;

private:
    /**
     * @brief Report a planned rename and perform it when renaming in place
     *
     * Throws std::filesystem::filesystem_error if the rename fails.
     */
    void applyOperation(RenameOperation& operation);

    RenameOptions m_options;
    std::ostream& m_out;
    NameTransformer m_transformer;
    SysInteraction m_sys;
};

} // namespace NameFmt
