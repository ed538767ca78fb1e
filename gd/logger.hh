#pragma once

#include <string>

#include <gopdeps/parser_error.hh>

namespace gopdeps::driver {

enum class LogLevel {
    Quiet,   // Failed files only
    Normal,  // + warnings
    Verbose, // + files and modules as they are scanned
    Debug    // + per-file details
};

enum class ColorMode {
    Auto,    // Color when stderr is a terminal
    Always,
    Never
};

/**
 * Diagnostics for the gopdeps command line, colored with termcolor.
 *
 * Everything goes to stderr: stdout carries only the import paths,
 * one per line, so the output can be piped.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// "file:line:col: error: reason" for parse errors, "error: message" otherwise
    void scan_failure(const scan_error& e);

private:
    LogLevel level_;

    bool should_log(LogLevel required_level) const;
};

} // namespace gopdeps::driver
