// =================================================================
// src/NameFmt/NameTransformer.cpp
// =================================================================
// Implementation of pattern dispatch, detection and name formatting.

#include "NameFmt/NameTransformer.hpp"
#include "NameFmt/CaseConverter.hpp"
#include "NameFmt/Logger.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace NameFmt {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Existence check that treats any stat error as "not there".
bool pathExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool containsPackageFile(const std::filesystem::path& dir, const std::vector<std::string>& package_files) {
    return std::any_of(package_files.begin(), package_files.end(),
                       [&dir](const std::string& file) { return pathExists(dir / file); });
}

} // namespace

NameTransformer::NameTransformer(const FormatConfig& config, Clock clock)
    : m_config(config)
{
    // The date is fixed for the whole run.
    m_timestamp_prefix = timestampPrefix(clock ? clock() : std::chrono::system_clock::now());
}

std::optional<std::string> NameTransformer::formatFilename(const std::string& name,
                                                           const std::filesystem::path& path,
                                                           bool timestamp) const {
    std::string result = name;

    if (isExeOrPackage(path)) {
        result = CaseConverter::toKebabCase(result);
        LOG_DEBUG("NameTransformer", "Executable or package detected: " + path.string());
    } else {
        bool matched = false;
        for (const auto& behavior : m_config.behaviors) {
            if (matchesPattern(name, behavior.pattern)) {
                result = CaseConverter::applyStyle(name, behavior.style);
                matched = true;
                LOG_DEBUG("NameTransformer", "Pattern '" + behavior.pattern + "' matched " + name +
                          " (" + NamingStyleUtils::toString(behavior.style) + ")");
                break;
            }
        }

        if (!matched && m_config.replace_spaces) {
            std::replace(result.begin(), result.end(), ' ', '_');
        }
    }

    if (timestamp) {
        result = m_timestamp_prefix + result;
    }

    if (result == name) {
        return std::nullopt;
    }
    return result;
}

bool NameTransformer::isExeOrPackage(const std::filesystem::path& path) const {
    return isExeOrPackage(path, m_config.detection);
}

bool NameTransformer::isExeOrPackage(const std::filesystem::path& path, const DetectionRules& rules) {
    std::string extension = path.extension().string();
    if (!extension.empty()) {
        extension = CaseConverter::toLower(extension.substr(1));
        for (const auto& exe_ext : rules.exe_extensions) {
            std::string wanted = CaseConverter::toLower(exe_ext);
            if (!wanted.empty() && wanted[0] == '.') {
                wanted.erase(0, 1);
            }
            if (wanted == extension) {
                return true;
            }
        }
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return containsPackageFile(path, rules.package_dirs);
    }
    return containsPackageFile(path.parent_path(), rules.package_dirs);
}

bool NameTransformer::matchesPattern(const std::string& name, const std::string& pattern) {
    size_t star = pattern.find('*');
    if (star == std::string::npos) {
        return name.find(pattern) != std::string::npos;
    }

    // More than one wildcard is unsupported and never matches.
    if (pattern.find('*', star + 1) != std::string::npos) {
        return false;
    }

    return startsWith(name, pattern.substr(0, star)) && endsWith(name, pattern.substr(star + 1));
}

std::string NameTransformer::timestampPrefix(const std::chrono::system_clock::time_point& time_point) {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &time);
#else
    gmtime_r(&time, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y_%m_%d") << "__";
    return oss.str();
}

} // namespace NameFmt
