//
// Source file header AST: package clause and import declarations.
//

#pragma once
#include <string>
#include <cstddef>
#include <utility>
#include <vector>
#include <optional>

namespace gopdeps::ast {
    struct source_pos {
        source_pos(std::string file_, std::size_t line_, std::size_t column_)
            : file(std::move(file_)),
              line(line_),
              column(column_) {
        }

        std::string file;
        std::size_t line;
        std::size_t column;
    };

    // Kind of a basic literal token, as the scanner classified it
    enum class lit_kind {
        integer,
        floating,
        imaginary,
        character,
        string
    };

    // Literal token exactly as written in the source (quotes included)
    struct basic_lit {
        source_pos pos;
        lit_kind kind;
        std::string value;
    };

    // "package main"
    struct package_clause {
        source_pos pos;
        std::string name;
    };

    // One import specification: [name] "path"
    struct import_spec {
        source_pos pos;
        std::optional<std::string> name;  // Local name: identifier, "_" or "."
        basic_lit path;
    };

    // Everything the header parser reads from a file
    struct file_header {
        std::optional<package_clause> package;  // Optional in Go+ sources
        std::vector<import_spec> imports;
    };
}
