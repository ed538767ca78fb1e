#include "deps_scanner.hh"
#include "source_files.hh"
#include <gopdeps/parser_error.hh>
#include <algorithm>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace gopdeps::driver {

DepsScanner::DepsScanner(const ScanOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int DepsScanner::run() {
    for (const auto& input : options_.inputs) {
        scan_input(input);
    }

    logger_.verbose("Scanned " + std::to_string(files_.size()) + " file(s) in " +
                    std::to_string(parsers_.size()) + " module(s)");

    print_imports();
    return exit_code_;
}

// ============================================================================
// Input Walking
// ============================================================================

void DepsScanner::scan_input(const fs::path& input) {
    std::error_code ec;
    if (!fs::is_directory(input, ec)) {
        // Files named explicitly are scanned whatever their extension
        scan_file(input);
        return;
    }

    auto on_error = [this](const fs::path& dir, const std::error_code& error) {
        report(dir.string() + ": " + error.message());
    };
    std::vector<fs::path> sources = find_source_files(input, on_error);

    if (sources.empty()) {
        logger_.warning("No .gop or .go files found in " + input.string());
        return;
    }

    for (const auto& source : sources) {
        scan_file(source);
    }
}

void DepsScanner::scan_file(const fs::path& file) {
    logger_.verbose("Scanning: " + file.string());

    try {
        imports_parser& parser = parser_for(file);
        std::size_t before = parser.imports().size();

        parser.parse_imports(file);

        logger_.debug(file.string() + ": " +
                      std::to_string(parser.imports().size() - before) + " new import(s) for module " +
                      parser.owner().path());
    } catch (const scan_error& e) {
        logger_.scan_failure(e);
        exit_code_ = 2;
    } catch (const module_error& e) {
        report(e.what());
    }
}

// ============================================================================
// Module Resolution
// ============================================================================

imports_parser& DepsScanner::parser_for(const fs::path& file) {
    parse_options parse_opts;
    parse_opts.dialect = options_.dialect;

    if (options_.module_path) {
        // One module for every input
        auto& parser = parsers_[fs::path()];
        if (!parser) {
            parser = std::make_unique<imports_parser>(files_, module(*options_.module_path), parse_opts);
        }
        return *parser;
    }

    std::error_code ec;
    fs::path dir = fs::absolute(file, ec).parent_path();
    if (ec) {
        dir = file.parent_path();
    }
    auto cached = parser_by_dir_.find(dir);
    if (cached != parser_by_dir_.end()) {
        return *cached->second;
    }

    module mod = load_module(dir);
    logger_.verbose("Module " + mod.path() + " (" + mod.root_dir().string() + ")");

    auto& parser = parsers_[mod.root_dir()];
    if (!parser) {
        parser = std::make_unique<imports_parser>(files_, std::move(mod), parse_opts);
    }
    parser_by_dir_[dir] = parser.get();
    return *parser;
}

void DepsScanner::print_imports() const {
    imports_parser::import_set merged;
    for (const auto& [root, parser] : parsers_) {
        parser->merge_into(merged);
    }

    std::vector<std::string> sorted(merged.begin(), merged.end());
    std::sort(sorted.begin(), sorted.end());
    for (const auto& path : sorted) {
        std::cout << path << "\n";
    }
}

void DepsScanner::report(const std::string& message) {
    logger_.error(message);
    exit_code_ = 2;
}

}  // namespace gopdeps::driver
