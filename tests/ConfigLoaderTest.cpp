// =================================================================
// tests/ConfigLoaderTest.cpp
// =================================================================
// Unit tests for configuration discovery, creation and parsing.

#include "NameFmt/ConfigLoader.hpp"
#include "NameFmt/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using NameFmt::ConfigLoader;
using NameFmt::FormatConfig;
using NameFmt::NamingStyle;

class ConfigLoaderTest {
private:
    fs::path test_dir;

    void cleanupTestFiles() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void writeConfig(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    static bool isDefault(const FormatConfig& config) {
        FormatConfig defaults;
        return config.replace_spaces == defaults.replace_spaces &&
               config.behaviors.empty() &&
               config.detection.exe_extensions == defaults.detection.exe_extensions &&
               config.detection.package_dirs == defaults.detection.package_dirs;
    }

public:
    ConfigLoaderTest() : test_dir(fs::temp_directory_path() / "namefmt_config_loader_test") {}

    void testDefaults() {
        std::cout << "Testing built-in defaults..." << std::endl;

        FormatConfig config;
        assert(config.replace_spaces);
        assert(config.behaviors.empty());
        assert((config.detection.exe_extensions == std::vector<std::string>{"exe", "bin", "app"}));
        assert((config.detection.package_dirs ==
                std::vector<std::string>{"package.json", "Cargo.toml", "pyproject.toml"}));

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testParseFullDocument() {
        std::cout << "Testing full document parsing..." << std::endl;

        FormatConfig config = ConfigLoader::parseConfig(R"(
replace_spaces: false
behaviors:
  - pattern: "*.rs"
    style: snake_case
  - pattern: "Component"
    style: camelCase
  - pattern: "*.js"
    style: kebab-case
detection:
  exe_extensions: [exe, run]
  package_dirs: [go.mod]
)");

        assert(!config.replace_spaces);
        assert(config.behaviors.size() == 3);
        assert(config.behaviors[0].pattern == "*.rs" && config.behaviors[0].style == NamingStyle::SnakeCase);
        assert(config.behaviors[1].pattern == "Component" && config.behaviors[1].style == NamingStyle::CamelCase);
        assert(config.behaviors[2].pattern == "*.js" && config.behaviors[2].style == NamingStyle::KebabCase);
        assert((config.detection.exe_extensions == std::vector<std::string>{"exe", "run"}));
        assert((config.detection.package_dirs == std::vector<std::string>{"go.mod"}));

        std::cout << "✓ Full document test passed" << std::endl;
    }

    void testParsePartialDocument() {
        std::cout << "Testing per-field defaults..." << std::endl;

        FormatConfig only_flag = ConfigLoader::parseConfig("replace_spaces: false\n");
        assert(!only_flag.replace_spaces);
        assert(only_flag.detection.exe_extensions == NameFmt::DetectionRules::defaultExeExtensions());

        FormatConfig only_packages = ConfigLoader::parseConfig("detection:\n  package_dirs: [setup.py]\n");
        assert(only_packages.replace_spaces);
        assert(only_packages.detection.exe_extensions == NameFmt::DetectionRules::defaultExeExtensions());
        assert((only_packages.detection.package_dirs == std::vector<std::string>{"setup.py"}));

        assert(isDefault(ConfigLoader::parseConfig("")));
        assert(isDefault(ConfigLoader::parseConfig("# only a comment\n")));
        assert(isDefault(ConfigLoader::parseConfig(ConfigLoader::getDefaultConfigYaml())));

        std::cout << "✓ Partial document test passed" << std::endl;
    }

    void testParseErrors() {
        std::cout << "Testing parse errors..." << std::endl;

        const char* invalid_documents[] = {
            "replace_spaces: [unclosed",
            "replace_spaces: maybe\n",
            "behaviors:\n  - pattern: \"*.rs\"\n    style: PascalCase\n",
            "behaviors:\n  - pattern: \"*.rs\"\n",
            "behaviors: snake_case\n",
            "detection:\n  exe_extensions: exe\n",
            "- just\n- a list\n"
        };

        for (const char* document : invalid_documents) {
            bool threw = false;
            try {
                ConfigLoader::parseConfig(document);
            } catch (const std::exception&) {
                threw = true;
            }
            assert(threw && "Invalid document must be rejected");
        }

        std::cout << "✓ Parse errors test passed" << std::endl;
    }

    void testCreatesDefaultFile() {
        std::cout << "Testing default file creation..." << std::endl;

        cleanupTestFiles();
        fs::path config_path = test_dir / "nested" / "namefmt" / "namefmt.yml";

        ConfigLoader loader(config_path.string());
        FormatConfig config = loader.load();

        assert(fs::exists(config_path) && "Config file should be created");
        assert(readFile(config_path) == ConfigLoader::getDefaultConfigYaml());
        assert(isDefault(config));

        // A second load reads the existing file without rewriting it
        writeConfig(config_path, "replace_spaces: false\n");
        assert(!ConfigLoader(config_path.string()).load().replace_spaces);
        assert(readFile(config_path) == "replace_spaces: false\n");

        cleanupTestFiles();
        std::cout << "✓ Default file creation test passed" << std::endl;
    }

    void testFallbackOnInvalidFile() {
        std::cout << "Testing fallback on invalid file..." << std::endl;

        cleanupTestFiles();
        fs::path config_path = test_dir / "broken.yml";
        writeConfig(config_path, "behaviors:\n  - pattern: x\n    style: Title Case\n");

        FormatConfig config = ConfigLoader(config_path.string()).load();
        assert(isDefault(config) && "Invalid config falls back to defaults");
        assert(fs::exists(config_path) && "Invalid config file is left untouched");

        cleanupTestFiles();
        std::cout << "✓ Fallback test passed" << std::endl;
    }

    void testFallbackOnUncreatableDirectory() {
        std::cout << "Testing fallback when the config directory cannot be created..." << std::endl;

        cleanupTestFiles();
        fs::create_directories(test_dir);
        std::ofstream(test_dir / "blocker") << "not a directory";

        fs::path config_path = test_dir / "blocker" / "namefmt.yml";
        FormatConfig config = ConfigLoader(config_path.string()).load();
        assert(isDefault(config));

        cleanupTestFiles();
        std::cout << "✓ Uncreatable directory test passed" << std::endl;
    }

    void testResolveConfigPath() {
        std::cout << "Testing config path resolution..." << std::endl;

        assert(ConfigLoader::resolveConfigPath("/custom/file.yml") == "/custom/file.yml");

#if !defined(_WIN32) && !defined(__APPLE__)
        setenv("XDG_CONFIG_HOME", "/tmp/xdg-home", 1);
        assert(ConfigLoader::resolveConfigPath() == "/tmp/xdg-home/namefmt/namefmt.yml");

        unsetenv("XDG_CONFIG_HOME");
        setenv("HOME", "/home/someone", 1);
        assert(ConfigLoader::resolveConfigPath() == "/home/someone/.config/namefmt/namefmt.yml");

        unsetenv("HOME");
        bool threw = false;
        try {
            ConfigLoader::resolveConfigPath();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Missing config directory must be fatal");
#endif

        std::cout << "✓ Config path resolution test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigLoader unit tests..." << std::endl;

        testDefaults();
        testParseFullDocument();
        testParsePartialDocument();
        testParseErrors();
        testCreatesDefaultFile();
        testFallbackOnInvalidFile();
        testFallbackOnUncreatableDirectory();
        testResolveConfigPath();

        std::cout << "All ConfigLoader tests passed!" << std::endl;
    }
};

int main() {
    NameFmt::Logger::getInstance().setConsoleLogging(false);

    try {
        ConfigLoaderTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
