//
// Error types of the gopdeps library
//

#pragma once
#include <stdexcept>
#include <string>

namespace gopdeps {
    // Recoverable failure while scanning a single source file.
    // The caller decides whether to skip the file or abort.
    class scan_error : public std::runtime_error {
        public:
            scan_error(const std::string& msg, const std::string& file)
                : std::runtime_error(msg), file_(file) {
            }

            [[nodiscard]] const std::string& file() const { return file_; }

        private:
            std::string file_;
    };

    class parse_error : public scan_error {
        public:
            parse_error(const std::string& msg, const std::string& file, int line, int column)
                : scan_error(build_message(msg, file, line, column), file),
                  reason_(msg), line_(line), column_(column) {
            }

            [[nodiscard]] const std::string& reason() const { return reason_; }
            [[nodiscard]] int line() const { return line_; }
            [[nodiscard]] int column() const { return column_; }

        private:
            std::string reason_;
            int line_;
            int column_;

            static std::string build_message(const std::string& msg, const std::string& file,
                                             int line, int column);
    };

    class file_read_error : public scan_error {
        public:
            explicit file_read_error(const std::string& file)
                : scan_error("Cannot open file: " + file, file) {
            }
    };

    // The owning module of a file could not be determined
    class module_error : public std::runtime_error {
        public:
            explicit module_error(const std::string& msg)
                : std::runtime_error(msg) {
            }
    };

    // Unrecoverable: a token reached the literal decoder that the grammar
    // never produces in that position. Indicates a bug upstream of the
    // caller, never bad user input.
    class grammar_invariant_error : public std::logic_error {
        public:
            using std::logic_error::logic_error;
    };
}
