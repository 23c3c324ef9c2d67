// =================================================================
// src/NameFmt/Renamer.cpp
// =================================================================
// Implementation for the rename run.

#include "NameFmt/Renamer.hpp"
#include "NameFmt/FileScanner.hpp"
#include "NameFmt/Logger.hpp"
#include <algorithm>

namespace NameFmt {

size_t RenameSummary::appliedCount() const {
    return static_cast<size_t>(std::count_if(operations.begin(), operations.end(),
                                             [](const RenameOperation& op) { return op.applied; }));
}

Renamer::Renamer(const FormatConfig& config, const RenameOptions& options,
                 std::ostream& out, NameTransformer::Clock clock)
    : m_options(options),
      m_out(out),
      m_transformer(config, std::move(clock))
{
}

RenameSummary Renamer::processPath(const std::filesystem::path& path) {
    RenameSummary summary;

    FileScanner scanner(path);
    auto files = scanner.scanFiles();
    summary.candidates = files.size();

    // Every new name is decided against the tree as scanned, before the
    // first rename can move a package file out from under its siblings.
    std::vector<RenameOperation> planned;
    for (const auto& file : files) {
        auto operation = planFile(file);
        if (operation) {
            planned.push_back(*operation);
        }
    }

    for (auto& operation : planned) {
        try {
            applyOperation(operation);
            summary.operations.push_back(operation);
        } catch (const std::filesystem::filesystem_error& e) {
            summary.failures.emplace_back(operation.old_path.string(), e.what());
            if (m_options.error_policy == ErrorPolicy::Abort) {
                Logger::getInstance().logRunSummary(summary.candidates, summary.operations.size(),
                                                    summary.appliedCount(), summary.failures.size());
                throw;
            }
            LOG_ERROR("Renamer", "Failed to rename " + operation.old_path.string() + ": " + e.what());
        }
    }

    Logger::getInstance().logRunSummary(summary.candidates, summary.operations.size(),
                                        summary.appliedCount(), summary.failures.size());
    return summary;
}

std::optional<RenameOperation> Renamer::planFile(const std::filesystem::path& file_path) const {
    std::string name = file_path.filename().string();
    if (name.empty()) {
        return std::nullopt;
    }

    auto new_name = m_transformer.formatFilename(name, file_path, m_options.timestamp);
    if (!new_name) {
        return std::nullopt;
    }

    RenameOperation operation;
    operation.old_path = file_path;
    operation.new_path = file_path.parent_path() / *new_name;
    return operation;
}

void Renamer::applyOperation(RenameOperation& operation) {
    if (m_options.inplace) {
        m_sys.renamePath(operation.old_path.string(), operation.new_path.string());
        operation.applied = true;
        m_out << "Renamed: " << operation.old_path.string() << " -> "
              << operation.new_path.string() << std::endl;
    } else {
        m_out << "Would rename: " << operation.old_path.string() << " -> "
              << operation.new_path.string() << std::endl;
    }
}

} // namespace NameFmt
