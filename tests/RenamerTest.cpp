// =================================================================
// tests/RenamerTest.cpp
// =================================================================
// Unit tests for the rename run: dry run, in-place and error policies.

#include "NameFmt/Renamer.hpp"
#include "NameFmt/Logger.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using NameFmt::ErrorPolicy;
using NameFmt::FormatConfig;
using NameFmt::NamingStyle;
using NameFmt::RenameOptions;
using NameFmt::Renamer;

namespace {

std::chrono::system_clock::time_point fixedTime() {
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(1709640000));
}

} // namespace

class RenamerTest {
private:
    fs::path test_dir;

    void setupTestFiles() {
        cleanupTestFiles();
        fs::create_directories(test_dir / "sub");
        std::ofstream(test_dir / "My Notes.txt") << "notes";
        std::ofstream(test_dir / "clean_name.txt") << "clean";
        std::ofstream(test_dir / "sub" / "Nested File.md") << "nested";
    }

    // "a b.txt" wants to become "a_b.txt", which is an existing directory.
    void setupBlockedRename() {
        cleanupTestFiles();
        fs::create_directories(test_dir / "a_b.txt");
        std::ofstream(test_dir / "a_b.txt" / "keep") << "";
        std::ofstream(test_dir / "a b.txt") << "blocked";
        std::ofstream(test_dir / "c d.txt") << "free";
    }

    void cleanupTestFiles() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::string line(const std::string& verb, const fs::path& from, const fs::path& to) {
        return verb + ": " + from.string() + " -> " + to.string() + "\n";
    }

public:
    RenamerTest() : test_dir(fs::temp_directory_path() / "namefmt_renamer_test") {}

    void testDryRun() {
        std::cout << "Testing dry run..." << std::endl;

        setupTestFiles();

        FormatConfig config;
        RenameOptions options;
        std::ostringstream out;
        Renamer renamer(config, options, out);

        auto summary = renamer.processPath(test_dir);

        std::string expected =
            line("Would rename", test_dir / "My Notes.txt", test_dir / "My_Notes.txt") +
            line("Would rename", test_dir / "sub" / "Nested File.md", test_dir / "sub" / "Nested_File.md");
        assert(out.str() == expected);
        assert(summary.candidates == 3);
        assert(summary.operations.size() == 2);
        assert(summary.appliedCount() == 0);
        assert(summary.success());

        assert(fs::exists(test_dir / "My Notes.txt") && "Dry run must not touch the filesystem");
        assert(!fs::exists(test_dir / "My_Notes.txt"));

        cleanupTestFiles();
        std::cout << "✓ Dry run test passed" << std::endl;
    }

    void testInplace() {
        std::cout << "Testing in-place renames..." << std::endl;

        setupTestFiles();

        FormatConfig config;
        config.behaviors.emplace_back("*.md", NamingStyle::KebabCase);
        RenameOptions options;
        options.inplace = true;
        std::ostringstream out;
        Renamer renamer(config, options, out);

        auto summary = renamer.processPath(test_dir);

        std::string expected =
            line("Renamed", test_dir / "My Notes.txt", test_dir / "My_Notes.txt") +
            line("Renamed", test_dir / "sub" / "Nested File.md", test_dir / "sub" / "nested-file.md");
        assert(out.str() == expected);
        assert(summary.appliedCount() == 2);

        assert(!fs::exists(test_dir / "My Notes.txt"));
        assert(fs::exists(test_dir / "My_Notes.txt"));
        assert(fs::exists(test_dir / "sub" / "nested-file.md") && "Parent directory is preserved");
        assert(fs::exists(test_dir / "clean_name.txt") && "Unchanged names stay put");

        cleanupTestFiles();
        std::cout << "✓ In-place test passed" << std::endl;
    }

    void testSingleFileWithTimestamp() {
        std::cout << "Testing single file with timestamp..." << std::endl;

        setupTestFiles();

        FormatConfig config;
        RenameOptions options;
        options.timestamp = true;
        std::ostringstream out;
        Renamer renamer(config, options, out, fixedTime);

        fs::path file = test_dir / "clean_name.txt";
        auto summary = renamer.processPath(file);

        assert(summary.candidates == 1);
        assert(out.str() == line("Would rename", file, test_dir / "2024_03_05__clean_name.txt"));

        cleanupTestFiles();
        std::cout << "✓ Single file timestamp test passed" << std::endl;
    }

    void testMissingPath() {
        std::cout << "Testing missing path..." << std::endl;

        cleanupTestFiles();

        FormatConfig config;
        std::ostringstream out;
        Renamer renamer(config, RenameOptions{}, out);

        bool threw = false;
        try {
            renamer.processPath(test_dir / "nowhere");
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "Path does not exist: " + (test_dir / "nowhere").string();
        }
        assert(threw && "Missing path must be fatal");
        assert(out.str().empty());

        std::cout << "✓ Missing path test passed" << std::endl;
    }

    void testAbortOnFailure() {
        std::cout << "Testing abort on first failure..." << std::endl;

        setupBlockedRename();

        FormatConfig config;
        RenameOptions options;
        options.inplace = true;
        std::ostringstream out;
        Renamer renamer(config, options, out);

        bool threw = false;
        try {
            renamer.processPath(test_dir);
        } catch (const fs::filesystem_error&) {
            threw = true;
        }
        assert(threw && "Rename failure must propagate");
        assert(out.str().empty());
        assert(fs::exists(test_dir / "c d.txt") && "Remaining files are not processed");

        cleanupTestFiles();
        std::cout << "✓ Abort policy test passed" << std::endl;
    }

    void testContinueOnFailure() {
        std::cout << "Testing continue after failure..." << std::endl;

        setupBlockedRename();

        FormatConfig config;
        RenameOptions options;
        options.inplace = true;
        options.error_policy = ErrorPolicy::Continue;
        std::ostringstream out;
        Renamer renamer(config, options, out);

        auto summary = renamer.processPath(test_dir);

        assert(!summary.success());
        assert(summary.failures.size() == 1);
        assert(summary.failures[0].first == (test_dir / "a b.txt").string());
        assert(summary.appliedCount() == 1);
        assert(out.str() == line("Renamed", test_dir / "c d.txt", test_dir / "c_d.txt"));
        assert(fs::exists(test_dir / "a b.txt"));
        assert(fs::exists(test_dir / "c_d.txt"));

        cleanupTestFiles();
        std::cout << "✓ Continue policy test passed" << std::endl;
    }

    void testInplaceMatchesDryRunInPackageRoot() {
        std::cout << "Testing in-place run inside a package root..." << std::endl;

        // Cargo.toml sorts first and is itself kebab-cased; its sibling must
        // still be treated as part of the package.
        auto setupPackage = [this]() {
            cleanupTestFiles();
            fs::create_directories(test_dir / "pkg");
            std::ofstream(test_dir / "pkg" / "Cargo.toml") << "[package]\n";
            std::ofstream(test_dir / "pkg" / "src file.rs") << "";
        };

        FormatConfig config;
        fs::path pkg = test_dir / "pkg";

        setupPackage();
        RenameOptions dry_options;
        std::ostringstream dry_out;
        Renamer dry_renamer(config, dry_options, dry_out);
        auto dry_summary = dry_renamer.processPath(test_dir);
        assert(dry_summary.success());
        assert(dry_out.str() ==
               line("Would rename", pkg / "Cargo.toml", pkg / "cargo.toml") +
               line("Would rename", pkg / "src file.rs", pkg / "src-file.rs"));

        setupPackage();
        RenameOptions options;
        options.inplace = true;
        std::ostringstream out;
        Renamer renamer(config, options, out);
        auto summary = renamer.processPath(test_dir);
        assert(summary.success());
        assert(summary.appliedCount() == 2);
        assert(out.str() ==
               line("Renamed", pkg / "Cargo.toml", pkg / "cargo.toml") +
               line("Renamed", pkg / "src file.rs", pkg / "src-file.rs"));

        assert(fs::exists(test_dir / "pkg" / "src-file.rs") && "Sibling of the package file is kebab-cased");
        assert(!fs::exists(test_dir / "pkg" / "src_file.rs"));

        cleanupTestFiles();
        std::cout << "✓ Package root in-place test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Renamer unit tests..." << std::endl;

        testDryRun();
        testInplace();
        testSingleFileWithTimestamp();
        testMissingPath();
        testAbortOnFailure();
        testContinueOnFailure();
        testInplaceMatchesDryRunInPackageRoot();

        std::cout << "All Renamer tests passed!" << std::endl;
    }
};

int main() {
    NameFmt::Logger::getInstance().setConsoleLogging(false);

    try {
        RenamerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
