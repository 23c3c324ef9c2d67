// =================================================================
// include/NameFmt/Config.hpp
// =================================================================
// Configuration model for filename formatting: naming styles,
// pattern behaviors and executable/package detection rules.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace NameFmt {

/**
 * @brief Naming styles a file name can be converted to
 */
enum class NamingStyle {
    CamelCase,  ///< someThing
    SnakeCase,  ///< some_thing
    KebabCase   ///< some-thing
};

/**
 * @brief A pattern and the style applied to names matching it
 */
struct Behavior {
    std::string pattern;
    NamingStyle style;

    Behavior(const std::string& pat, NamingStyle st) : pattern(pat), style(st) {}
};

/**
 * @brief Heuristics that identify executables and package roots
 *
 * Files caught by these rules are always converted to kebab-case,
 * regardless of the configured behaviors.
 */
struct DetectionRules {
    std::vector<std::string> exe_extensions = defaultExeExtensions();
    std::vector<std::string> package_dirs = defaultPackageDirs();

    static std::vector<std::string> defaultExeExtensions();
    static std::vector<std::string> defaultPackageDirs();
};

/**
 * @brief Resolved configuration for a formatting run
 *
 * Loaded once at startup and read-only afterwards. Behaviors are
 * evaluated in declaration order and the first match wins.
 */
struct FormatConfig {
    bool replace_spaces = true;
    std::vector<Behavior> behaviors;
    DetectionRules detection;
};

/**
 * @brief Utility functions for naming style names
 */
class NamingStyleUtils {
public:
    /**
     * @brief Convert a style to its configuration spelling
     * @param style Naming style
     * @return "camelCase", "snake_case" or "kebab-case"
     */
    static std::string toString(NamingStyle style);

    /**
     * @brief Parse a configuration spelling into a style
     * @param name Style name as written in the config file
     * @return The style, or std::nullopt for an unknown name
     */
    static std::optional<NamingStyle> fromString(const std::string& name);
};

} // namespace NameFmt
