#include "logger.hh"
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace gopdeps::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
{
    switch (color) {
        case ColorMode::Always:
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cerr << termcolor::cyan
              << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    std::cerr << termcolor::magenta
              << "[debug] " << termcolor::reset
              << message << "\n";
}

void Logger::scan_failure(const scan_error& e) {
    const auto* parse_failure = dynamic_cast<const parse_error*>(&e);
    if (!parse_failure) {
        error(e.what());
        return;
    }

    std::cerr << termcolor::bold
              << parse_failure->file() << ":" << parse_failure->line() << ":" << parse_failure->column() << ": "
              << termcolor::red << "error: " << termcolor::reset
              << parse_failure->reason() << "\n";
}

} // namespace gopdeps::driver
