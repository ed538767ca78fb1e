#pragma once

#include "logger.hh"
#include <gopdeps/parser.hh>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gopdeps::driver {

/// Scanner options (driver configuration only)
struct ScanOptions {
    // ========================================================================
    // Input
    // ========================================================================

    std::vector<std::filesystem::path> inputs;       // Files and directories

    // ========================================================================
    // Resolution
    // ========================================================================

    std::optional<std::string> module_path;          // -m, --module (skips marker lookup)
    std::optional<source_dialect> dialect;           // --dialect=go|gop

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool debug = false;                              // --debug
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
ScanOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace gopdeps::driver
