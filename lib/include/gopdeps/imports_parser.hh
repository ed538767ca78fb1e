//
// Accumulates the canonical import paths of the files of one module
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "ast.hh"
#include "file_set.hh"
#include "module.hh"
#include "parser.hh"

namespace gopdeps {
    /**
     * Reads the import declarations of source files and collects the
     * canonical import path of every package they reference.
     *
     * One instance per analysis session. The set only grows; parsing the
     * same file twice, or files in any order, gives the same result.
     * Not safe for concurrent use: give each thread its own parser and
     * combine the results with merge_into().
     */
    class imports_parser {
        public:
            using import_set = std::unordered_set<std::string>;

            imports_parser(file_set& files, module mod, parse_options options = {});

            imports_parser(const imports_parser&) = delete;
            imports_parser& operator =(const imports_parser&) = delete;

            /// Parses the header of `file` and adds its imports.
            /// Throws file_read_error or parse_error; on failure nothing
            /// from this file is added.
            void parse_imports(const std::filesystem::path& file);

            /// Same for source text already in memory
            void parse_imports(const std::string& filename, const std::string& source);

            [[nodiscard]] const import_set& imports() const { return imports_; }
            [[nodiscard]] std::vector<std::string> sorted_imports() const;

            [[nodiscard]] const module& owner() const { return module_; }
            [[nodiscard]] std::size_t files_parsed() const { return files_parsed_; }

            void merge_into(import_set& target) const;

        private:
            void add_imports(const ast::file_header& header);

            file_set& files_;
            module module_;
            parse_options options_;
            import_set imports_;
            std::size_t files_parsed_ = 0;
    };
}
