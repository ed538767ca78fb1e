//
// Module context: locating and reading module marker files
//

#include <gopdeps/module.hh>
#include <gopdeps/literal.hh>
#include <gopdeps/parser_error.hh>

#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace gopdeps {
    namespace {
        constexpr std::string_view WHITESPACE = " \t\r";

        std::string_view trim(std::string_view s) {
            auto first = s.find_first_not_of(WHITESPACE);
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = s.find_last_not_of(WHITESPACE);
            return s.substr(first, last - first + 1);
        }

        // Drops a trailing "//" comment that is not inside a quoted string
        std::string_view strip_comment(std::string_view line) {
            char quote = 0;
            for (std::size_t i = 0; i < line.size(); ++i) {
                char c = line[i];
                if (quote) {
                    if (c == '\\' && quote == '"') {
                        ++i;
                    } else if (c == quote) {
                        quote = 0;
                    }
                } else if (c == '"' || c == '`') {
                    quote = c;
                } else if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') {
                    return line.substr(0, i);
                }
            }
            return line;
        }

        std::string read_file(const fs::path& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                throw module_error("Cannot open module file: " + path.string());
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

        // Marker file in `dir`, if there is one
        std::optional<fs::path> find_marker(const fs::path& dir, const module_options& options) {
            for (const auto& name : options.marker_files) {
                fs::path candidate = dir / name;
                std::error_code ec;
                if (fs::is_regular_file(candidate, ec)) {
                    return candidate;
                }
            }
            return std::nullopt;
        }
    } // anonymous namespace

    std::string parse_module_directive(const std::string& text, const std::string& filename) {
        std::istringstream lines(text);
        std::string raw_line;
        int line_number = 0;

        while (std::getline(lines, raw_line)) {
            ++line_number;
            std::string_view line = trim(strip_comment(raw_line));

            constexpr std::string_view keyword = "module";
            if (line.substr(0, keyword.size()) != keyword) {
                continue;
            }
            std::string_view rest = line.substr(keyword.size());
            if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t' &&
                rest.front() != '"' && rest.front() != '`') {
                // An identifier that merely starts with "module"
                continue;
            }
            rest = trim(rest);

            std::string path;
            if (!rest.empty() && (rest.front() == '"' || rest.front() == '`')) {
                std::optional<std::string> unquoted = unquote(rest);
                if (!unquoted) {
                    throw module_error(filename + ":" + std::to_string(line_number) +
                                       ": invalid quoted module path: " + std::string(rest));
                }
                path = std::move(*unquoted);
            } else {
                path = std::string(rest);
            }

            if (path.empty() || path.find_first_of(" \t") != std::string::npos) {
                throw module_error(filename + ":" + std::to_string(line_number) +
                                   ": invalid module path: '" + path + "'");
            }
            return path;
        }

        throw module_error(filename + ": no module directive found");
    }

    module load_module(const fs::path& start, const module_options& options) {
        std::error_code ec;
        fs::path dir = fs::absolute(start, ec);
        if (ec) {
            throw module_error("Cannot resolve path " + start.string() + ": " + ec.message());
        }
        if (!fs::is_directory(dir, ec)) {
            dir = dir.parent_path();
        }

        while (true) {
            if (auto marker = find_marker(dir, options)) {
                std::string path = parse_module_directive(read_file(*marker), marker->string());
                return module(std::move(path), dir);
            }
            if (!dir.has_parent_path() || dir.parent_path() == dir) {
                break;
            }
            dir = dir.parent_path();
        }

        std::string names;
        for (const auto& name : options.marker_files) {
            if (!names.empty()) names += " or ";
            names += name;
        }
        throw module_error("No " + names + " found in " + start.string() + " or any parent directory");
    }
}
