//
// gopdeps command-line entry point
//

#include <iostream>
#include <string>

#include <gopdeps/parser_error.hh>

#include "deps_scanner.hh"
#include "scan_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace gopdeps::driver;

    try {
        // Parse command-line options (handles --help and --version automatically)
        ScanOptions opts = parse_command_line(argc, argv);

        // Create logger based on verbosity options
        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;
        if (opts.debug) log_level = LogLevel::Debug;

        Logger logger(log_level, opts.color);

        DepsScanner scanner(opts, logger);
        return scanner.run();

    } catch (const gopdeps::grammar_invariant_error& e) {
        std::cerr << "Internal error: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
