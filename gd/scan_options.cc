#include "scan_options.hh"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace gopdeps::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

static source_dialect parse_dialect(const std::string& value) {
    if (value == "go") return source_dialect::go;
    if (value == "gop") return source_dialect::gop;
    throw std::runtime_error("Invalid dialect: " + value + " (expected: go, gop)");
}

static ColorMode parse_color(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
}

// ============================================================================
// Main Parser
// ============================================================================

ScanOptions parse_command_line(int argc, char** argv) {
    ScanOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        // Module path override
        if (starts_with(arg, "--module=")) {
            opts.module_path = get_option_value(arg, "--module=");
            if (opts.module_path->empty()) {
                throw std::runtime_error("Option --module requires argument");
            }
            continue;
        }

        if (starts_with(arg, "-m")) {
            std::string value = get_option_value(arg, "-m");
            if (value.empty() && i + 1 < argc) {
                value = argv[++i];
            }
            if (value.empty()) {
                throw std::runtime_error("Option -m requires argument");
            }
            opts.module_path = value;
            continue;
        }

        // Dialect
        if (starts_with(arg, "--dialect=")) {
            opts.dialect = parse_dialect(get_option_value(arg, "--dialect="));
            continue;
        }

        // Colors
        if (starts_with(arg, "--color=")) {
            opts.color = parse_color(get_option_value(arg, "--color="));
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file or directory
        opts.inputs.push_back(arg);
    }

    // Validation
    if (opts.inputs.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <files-or-directories>\n\n";

    std::cout << "Prints the canonical import paths referenced by Go+ (.gop) and Go (.go)\n";
    std::cout << "sources, one per line. Directories are scanned recursively.\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Resolution:\n";
    std::cout << "  -m <path>, --module=<path>\n";
    std::cout << "                          Module root import path (default: from the nearest\n";
    std::cout << "                          gop.mod or go.mod)\n";
    std::cout << "  --dialect=<go|gop>      Parse every file as Go or Go+ (default: by extension)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  --debug                 Report what every file adds\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color=<mode>          auto, always or never (default: auto)\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " main.gop\n";
    std::cout << "  " << program_name << " -m example.com/app ./src\n";
}

void print_version() {
    std::cout << "gopdeps v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace gopdeps::driver
