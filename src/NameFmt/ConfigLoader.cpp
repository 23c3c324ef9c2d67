// =================================================================
// src/NameFmt/ConfigLoader.cpp
// =================================================================
// Implementation for configuration discovery and YAML parsing.

#include "NameFmt/ConfigLoader.hpp"
#include "NameFmt/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace NameFmt {

namespace {

std::string getEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& key) {
    if (!node.IsSequence()) {
        throw std::runtime_error("'" + key + "' must be a list of strings");
    }
    return node.as<std::vector<std::string>>();
}

} // namespace

ConfigLoader::ConfigLoader(const std::string& config_path)
    : m_config_path(config_path)
{
}

FormatConfig ConfigLoader::load() {
    if (!m_sys.pathExists(m_config_path)) {
        std::string parent = std::filesystem::path(m_config_path).parent_path().string();
        std::string error_message;
        if (!m_sys.createDirectories(parent, error_message)) {
            return useDefaults("Failed to create config directory " + parent + ": " + error_message);
        }

        if (!m_sys.writeFile(m_config_path, getDefaultConfigYaml())) {
            return useDefaults("Failed to write default config to " + m_config_path);
        }
        LOG_INFO("ConfigLoader", "Created default configuration file: " + m_config_path);
    }

    std::string content;
    try {
        content = m_sys.readFile(m_config_path);
    } catch (const std::runtime_error& e) {
        return useDefaults("Failed to read " + m_config_path + ": " + e.what());
    }

    try {
        FormatConfig config = parseConfig(content);
        Logger::getInstance().debug("ConfigLoader", "Loaded configuration: " + m_config_path,
            "Behaviors: " + std::to_string(config.behaviors.size()));
        return config;
    } catch (const std::exception& e) {
        return useDefaults("Failed to parse " + m_config_path + ": " + e.what());
    }
}

FormatConfig ConfigLoader::useDefaults(const std::string& reason) {
    Logger::getInstance().warning("ConfigLoader", reason, "using default configuration");
    return FormatConfig{};
}

std::string ConfigLoader::resolveConfigPath(const std::string& custom_path) {
    if (!custom_path.empty()) {
        return custom_path;
    }

    auto config_dir = getConfigDirectory();
    if (!config_dir) {
        throw std::runtime_error("Could not determine config directory");
    }

    return (std::filesystem::path(*config_dir) / "namefmt" / "namefmt.yml").string();
}

std::optional<std::string> ConfigLoader::getConfigDirectory() {
#if defined(_WIN32)
    std::string app_data = getEnv("APPDATA");
    if (!app_data.empty()) {
        return app_data;
    }
#elif defined(__APPLE__)
    std::string home = getEnv("HOME");
    if (!home.empty()) {
        return home + "/Library/Application Support";
    }
#else
    std::string xdg_config = getEnv("XDG_CONFIG_HOME");
    if (!xdg_config.empty() && std::filesystem::path(xdg_config).is_absolute()) {
        return xdg_config;
    }
    std::string home = getEnv("HOME");
    if (!home.empty()) {
        return home + "/.config";
    }
#endif
    return std::nullopt;
}

FormatConfig ConfigLoader::parseConfig(const std::string& yaml_text) {
    FormatConfig config;

    const YAML::Node root = YAML::Load(yaml_text);
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("configuration must be a mapping");
    }

    if (root["replace_spaces"]) {
        config.replace_spaces = root["replace_spaces"].as<bool>();
    }

    if (const YAML::Node behaviors = root["behaviors"]) {
        if (!behaviors.IsSequence()) {
            throw std::runtime_error("'behaviors' must be a list");
        }
        for (const auto& behavior : behaviors) {
            if (!behavior.IsMap() || !behavior["pattern"] || !behavior["style"]) {
                throw std::runtime_error("each behavior needs a 'pattern' and a 'style'");
            }

            std::string style_name = behavior["style"].as<std::string>();
            auto style = NamingStyleUtils::fromString(style_name);
            if (!style) {
                throw std::runtime_error("unknown naming style '" + style_name +
                                         "' (expected camelCase, snake_case or kebab-case)");
            }
            config.behaviors.emplace_back(behavior["pattern"].as<std::string>(), *style);
        }
    }

    if (const YAML::Node detection = root["detection"]) {
        if (!detection.IsMap()) {
            throw std::runtime_error("'detection' must be a mapping");
        }
        if (detection["exe_extensions"]) {
            config.detection.exe_extensions = readStringList(detection["exe_extensions"], "exe_extensions");
        }
        if (detection["package_dirs"]) {
            config.detection.package_dirs = readStringList(detection["package_dirs"], "package_dirs");
        }
    }

    return config;
}

std::string ConfigLoader::getDefaultConfigYaml() {
    return R"(# namefmt configuration
# Replace spaces with underscores when no behavior matches
replace_spaces: true

# Pattern-based styles, checked in order; the first match wins.
# A pattern without '*' matches any name containing it; a single '*'
# matches names starting with the text before it and ending with the
# text after it. Styles: camelCase, snake_case, kebab-case.
# behaviors:
#   - pattern: "*.rs"
#     style: snake_case
#   - pattern: "*.js"
#     style: kebab-case

# Executables and files inside package roots are always kebab-cased
detection:
  exe_extensions: [exe, bin, app]
  package_dirs: [package.json, Cargo.toml, pyproject.toml]
)";
}

} // namespace NameFmt
