//
// Accumulates the canonical import paths of the files of one module
//

#include <gopdeps/imports_parser.hh>
#include <gopdeps/canonical.hh>
#include <gopdeps/literal.hh>

#include <algorithm>
#include <utility>

namespace gopdeps {
    imports_parser::imports_parser(file_set& files, module mod, parse_options options)
        : files_(files),
          module_(std::move(mod)),
          options_(options) {
    }

    void imports_parser::parse_imports(const std::filesystem::path& file) {
        source_dialect dialect = options_.dialect.value_or(dialect_for(file));
        add_imports(parse_header(files_, file, dialect));
    }

    void imports_parser::parse_imports(const std::string& filename, const std::string& source) {
        source_dialect dialect = options_.dialect.value_or(dialect_for(filename));
        add_imports(parse_header(files_, filename, source, dialect));
    }

    void imports_parser::add_imports(const ast::file_header& header) {
        // Decode everything before touching the set so a failure adds nothing
        std::vector<std::string> batch;
        batch.reserve(header.imports.size());
        for (const auto& spec : header.imports) {
            batch.push_back(canonical_import_path(decode_string_literal(spec.path), module_));
        }

        for (auto& path : batch) {
            imports_.insert(std::move(path));
        }
        ++files_parsed_;
    }

    std::vector<std::string> imports_parser::sorted_imports() const {
        std::vector<std::string> result(imports_.begin(), imports_.end());
        std::sort(result.begin(), result.end());
        return result;
    }

    void imports_parser::merge_into(import_set& target) const {
        target.insert(imports_.begin(), imports_.end());
    }
}
