//
// Header parser: reads the package clause and import declarations of
// Go / Go+ sources and stops at the first other declaration.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "ast.hh"
#include "file_set.hh"
#include "parser_error.hh"

namespace gopdeps {
    enum class source_dialect {
        go,   // Package clause required
        gop   // Package clause optional
    };

    struct parse_options {
        // Dialect used for every file; unset selects by file extension
        std::optional<source_dialect> dialect;
    };

    // ".go" files are Go, everything else is Go+
    source_dialect dialect_for(const std::filesystem::path& path);

    // Throws file_read_error or parse_error
    ast::file_header parse_header(file_set& files, const std::filesystem::path& path, source_dialect dialect);
    ast::file_header parse_header(file_set& files, const std::string& filename, const std::string& text,
                                  source_dialect dialect);
}
