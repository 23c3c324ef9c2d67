// =================================================================
// include/NameFmt/ConfigLoader.hpp
// =================================================================
// Locates, creates and parses the namefmt.yml configuration file.

#pragma once

#include "NameFmt/Config.hpp"
#include "NameFmt/SysInteraction.hpp"
#include <optional>
#include <string>

namespace NameFmt {

class ConfigLoader {
public:
    /**
     * @brief Constructs a loader for the given configuration file.
     * @param config_path The path to the namefmt.yml file.
     */
    explicit ConfigLoader(const std::string& config_path);

    /**
     * @brief Loads the configuration, creating a default file if absent.
     *
     * Never fails: read or parse errors are reported as warnings and
     * the built-in defaults are returned instead.
     * @return The resolved configuration.
     */
    FormatConfig load();

    /**
     * @brief Determines which configuration file to use.
     * @param custom_path Explicit path from the command line, may be empty.
     * @return custom_path if given, otherwise the per-user default location.
     * Throws std::runtime_error if no config directory can be determined.
     */
    static std::string resolveConfigPath(const std::string& custom_path = "");

    /**
     * @brief Per-user configuration directory for this platform.
     * @return The directory, or std::nullopt if the environment does not
     *         provide one.
     */
    static std::optional<std::string> getConfigDirectory();

    /**
     * @brief Parses a YAML document into a configuration.
     *
     * Missing keys keep their defaults. Throws on malformed YAML, wrong
     * value types, unknown style names or incomplete behaviors.
     */
    static FormatConfig parseConfig(const std::string& yaml_text);

    /**
     * @brief The document written on first run.
     */
    static std::string getDefaultConfigYaml();

private:
    FormatConfig useDefaults(const std::string& reason);

    std::string m_config_path;
    SysInteraction m_sys;
};

} // namespace NameFmt
