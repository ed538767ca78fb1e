#pragma once

#include "scan_options.hh"
#include "logger.hh"
#include <gopdeps/file_set.hh>
#include <gopdeps/imports_parser.hh>
#include <gopdeps/module.hh>
#include <filesystem>
#include <map>
#include <memory>
#include <vector>

namespace gopdeps::driver {

/// Dependency scanner driver
class DepsScanner {
public:
    explicit DepsScanner(const ScanOptions& options, Logger& logger);

    /// Scan all inputs and print the merged import set
    /// Returns 0 on success, 2 if any file could not be scanned
    int run();

private:
    // ========================================================================
    // Input Walking
    // ========================================================================

    /// Scan a file or every source file below a directory
    void scan_input(const std::filesystem::path& input);

    /// Scan a single file into the parser of its module
    void scan_file(const std::filesystem::path& file);

    // ========================================================================
    // Module Resolution
    // ========================================================================

    /// Parser for the module owning `file`; one per module root
    imports_parser& parser_for(const std::filesystem::path& file);

    /// Print imports to stdout
    void print_imports() const;

    /// Record a failure; scanning continues
    void report(const std::string& message);

    // ========================================================================
    // State
    // ========================================================================

    const ScanOptions& options_;
    Logger& logger_;
    file_set files_;

    std::map<std::filesystem::path, std::unique_ptr<imports_parser>> parsers_;   // By module root
    std::map<std::filesystem::path, imports_parser*> parser_by_dir_;              // Lookup cache
    int exit_code_ = 0;
};

}  // namespace gopdeps::driver
