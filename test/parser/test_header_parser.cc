//
// Tests for the package clause / import declaration parser
//

#include "doctest/doctest.h"
#include "gopdeps/parser.hh"
#include "gopdeps/parser_error.hh"
#include <filesystem>
#include <string>

using namespace gopdeps;
namespace fs = std::filesystem;

namespace {
    ast::file_header parse(const std::string& source, source_dialect dialect = source_dialect::gop,
                           const std::string& filename = "test.gop") {
        file_set files;
        return parse_header(files, filename, source, dialect);
    }

    std::string path_of(const ast::import_spec& spec) {
        return spec.path.value;
    }
}

TEST_SUITE("Header Parser") {

    // ========================================
    // Import declarations
    // ========================================

    TEST_CASE("Parse package and single import") {
        auto header = parse("package main\n\nimport \"fmt\"\n", source_dialect::go, "main.go");

        REQUIRE(header.package.has_value());
        CHECK(header.package->name == "main");
        CHECK(header.package->pos.line == 1u);
        CHECK(header.package->pos.column == 9u);

        REQUIRE(header.imports.size() == 1);
        const auto& spec = header.imports[0];
        CHECK_FALSE(spec.name.has_value());
        CHECK(spec.path.kind == ast::lit_kind::string);
        CHECK(spec.path.value == "\"fmt\"");
        CHECK(spec.path.pos.file == "main.go");
        CHECK(spec.path.pos.line == 3u);
        CHECK(spec.path.pos.column == 8u);
        CHECK(spec.pos.line == 3u);
        CHECK(spec.pos.column == 8u);
    }

    TEST_CASE("Parse grouped imports") {
        auto header = parse(R"(package main

import (
	"fmt"
	"os"

	"github.com/goplus/gop/ast"
)
)");

        REQUIRE(header.imports.size() == 3);
        CHECK(path_of(header.imports[0]) == "\"fmt\"");
        CHECK(path_of(header.imports[1]) == "\"os\"");
        CHECK(path_of(header.imports[2]) == "\"github.com/goplus/gop/ast\"");
        CHECK(header.imports[2].path.pos.line == 7u);
        CHECK(header.imports[2].path.pos.column == 2u);
    }

    TEST_CASE("Parse named, dot and blank imports") {
        auto header = parse(R"(package main

import (
	f "fmt"
	. "strings"
	_ "os"
)
)");

        REQUIRE(header.imports.size() == 3);
        REQUIRE(header.imports[0].name.has_value());
        CHECK(*header.imports[0].name == "f");
        CHECK(header.imports[0].pos.column == 2u);
        CHECK(header.imports[0].path.pos.column == 4u);

        REQUIRE(header.imports[1].name.has_value());
        CHECK(*header.imports[1].name == ".");
        REQUIRE(header.imports[2].name.has_value());
        CHECK(*header.imports[2].name == "_");
        CHECK(path_of(header.imports[2]) == "\"os\"");
    }

    TEST_CASE("Parse group on one line") {
        auto header = parse("import (\"fmt\"; \"os\")\n");

        REQUIRE(header.imports.size() == 2);
        CHECK(path_of(header.imports[0]) == "\"fmt\"");
        CHECK(path_of(header.imports[1]) == "\"os\"");
    }

    TEST_CASE("Parse empty group") {
        auto header = parse("package main\nimport ()\nimport \"fmt\"\n");

        REQUIRE(header.imports.size() == 1);
        CHECK(path_of(header.imports[0]) == "\"fmt\"");
    }

    TEST_CASE("Parse multiple import declarations") {
        auto header = parse("package util\n\nimport \"strings\"\nimport \"./model\"\nimport (\"os\")\n");

        REQUIRE(header.imports.size() == 3);
        CHECK(path_of(header.imports[0]) == "\"strings\"");
        CHECK(path_of(header.imports[1]) == "\"./model\"");
        CHECK(path_of(header.imports[2]) == "\"os\"");
    }

    TEST_CASE("Parse raw string import path") {
        auto header = parse("import `fmt`\n");

        REQUIRE(header.imports.size() == 1);
        CHECK(path_of(header.imports[0]) == "`fmt`");
    }

    TEST_CASE("Parse long import group") {
        std::string source = "package big\n\nimport (\n";
        for (int i = 0; i < 300; i++) {
            source += "\t\"example.com/pkg" + std::to_string(i) + "\"\n";
        }
        source += ")\n";

        auto header = parse(source);

        REQUIRE(header.imports.size() == 300);
        CHECK(path_of(header.imports[0]) == "\"example.com/pkg0\"");
        CHECK(path_of(header.imports[299]) == "\"example.com/pkg299\"");
        CHECK(header.imports[299].path.pos.line == 303u);
    }

    // ========================================
    // End of header
    // ========================================

    TEST_CASE("Stop at first declaration") {
        auto header = parse(R"(package main

import "fmt"

var x = 1

import "os"
)");

        REQUIRE(header.imports.size() == 1);
        CHECK(path_of(header.imports[0]) == "\"fmt\"");
    }

    TEST_CASE("Body is never scanned") {
        // Unterminated string and NUL after the header
        std::string source = "package main\nimport \"fmt\"\nfunc main() { \"oops\n";
        source += '\0';

        auto header = parse(source);

        REQUIRE(header.imports.size() == 1);
    }

    TEST_CASE("Go+ script without package clause") {
        auto header = parse("import (\n\t\"fmt\"\n\t\"./util\"\n)\n\nprintln \"hello\"\n");

        CHECK_FALSE(header.package.has_value());
        REQUIRE(header.imports.size() == 2);
        CHECK(path_of(header.imports[1]) == "\"./util\"");
    }

    TEST_CASE("Go+ script without imports") {
        auto header = parse("println \"hello\"\n");

        CHECK_FALSE(header.package.has_value());
        CHECK(header.imports.empty());
    }

    TEST_CASE("Empty file") {
        auto header = parse("");

        CHECK_FALSE(header.package.has_value());
        CHECK(header.imports.empty());
    }

    TEST_CASE("Import without trailing newline") {
        auto header = parse("package main\nimport \"fmt\"");

        REQUIRE(header.imports.size() == 1);
    }

    // ========================================
    // Comments and semicolon insertion
    // ========================================

    TEST_CASE("Comments are skipped") {
        auto header = parse(R"(// Package main does things
package main // trailing

/* block */ import "fmt" // why
import ( // group
	"os" /* inline */
)
)");

        REQUIRE(header.imports.size() == 2);
        CHECK(header.imports[0].path.pos.line == 4u);
        CHECK(header.imports[0].path.pos.column == 20u);
    }

    TEST_CASE("Multi-line block comment ends a line") {
        auto header = parse("package main /* spans\nlines */ import \"fmt\"\n");

        REQUIRE(header.package.has_value());
        REQUIRE(header.imports.size() == 1);
        CHECK(header.imports[0].path.pos.line == 2u);
        CHECK(header.imports[0].path.pos.column == 17u);
    }

    TEST_CASE("CRLF line endings") {
        auto header = parse("package main\r\n\r\nimport (\r\n\t\"fmt\"\r\n)\r\n");

        REQUIRE(header.imports.size() == 1);
        CHECK(header.imports[0].path.pos.line == 4u);
    }

    // ========================================
    // Dialects
    // ========================================

    TEST_CASE("Go requires a package clause") {
        try {
            parse("import \"fmt\"\n", source_dialect::go, "main.go");
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.file() == "main.go");
            CHECK(e.line() == 1);
            CHECK(e.column() == 1);
            CHECK(e.reason() == "expected 'package'");
        }
    }

    TEST_CASE("dialect_for") {
        CHECK(dialect_for("main.go") == source_dialect::go);
        CHECK(dialect_for("dir/main.gop") == source_dialect::gop);
        CHECK(dialect_for("Rect.gox") == source_dialect::gop);
        CHECK(dialect_for("script") == source_dialect::gop);
    }

    // ========================================
    // Errors
    // ========================================

    TEST_CASE("Syntax error reports position") {
        try {
            parse("package main\n\nimport \"fmt\" \"os\"\n", source_dialect::gop, "bad.gop");
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.file() == "bad.gop");
            CHECK(e.line() == 3);
            CHECK(e.column() == 14);
            CHECK(e.reason().find("string literal") != std::string::npos);
            CHECK(std::string(e.what()).find("bad.gop:3:14: ") == 0);
        }
    }

    TEST_CASE("Syntax errors are scan errors") {
        CHECK_THROWS_AS(parse("import fmt\n"), scan_error);
        CHECK_THROWS_AS(parse("import\n"), parse_error);
        CHECK_THROWS_AS(parse("import"), parse_error);
        CHECK_THROWS_AS(parse("import (\"fmt\"\n"), parse_error);
        CHECK_THROWS_AS(parse("package\n"), parse_error);
    }

    TEST_CASE("Package clause after imports") {
        try {
            parse("import \"fmt\"\npackage main\n");
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.line() == 2);
            CHECK(e.column() == 1);
        }
    }

    TEST_CASE("Invalid import paths") {
        CHECK_THROWS_AS(parse("import \"a b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a:b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\\x00b\"\n"), parse_error);

        // Bytes that are not UTF-8, via escape and written directly
        CHECK_THROWS_AS(parse("import \"a\\xffb\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\xff" "b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\xc3" "zb\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\\uFFFDb\"\n"), parse_error);

        // Non-ASCII white space and invisible characters
        CHECK_THROWS_AS(parse("import \"a\\u00a0b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\\u0085b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\\u2003b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\\u3000b\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"a\\u200bb\"\n"), parse_error);

        try {
            parse("import \"a\\u00a0b\"\n");
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.reason().find("invalid import path") != std::string::npos);
        }

        try {
            parse("package main\nimport \"has space\"\n");
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.line() == 2);
            CHECK(e.column() == 8);
            CHECK(e.reason().find("invalid import path") != std::string::npos);
        }
    }

    TEST_CASE("Valid non-ASCII and long import paths") {
        auto header = parse("import (\n\t\"example.com/caf\xc3\xa9\"\n\t\"example.com/\\u4e16\"\n)\n");
        REQUIRE(header.imports.size() == 2);

        std::string long_path = "example.com/" + std::string(5000, 'a');
        auto long_header = parse("import \"" + long_path + "\"\n");
        REQUIRE(long_header.imports.size() == 1);
        CHECK(long_header.imports[0].path.value == "\"" + long_path + "\"");
    }

    TEST_CASE("Invalid code point in import path") {
        try {
            parse("import \"\\uD800\"\n");
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.reason().find("invalid string literal") != std::string::npos);
        }
    }

    TEST_CASE("Malformed string literals") {
        CHECK_THROWS_AS(parse("import \"\\q\"\n"), parse_error);
        CHECK_THROWS_AS(parse("import \"fmt\n"), parse_error);
        CHECK_THROWS_AS(parse("import `fmt\n"), parse_error);
        CHECK_THROWS_AS(parse("package main /* open\n"), parse_error);
    }

    TEST_CASE("NUL inside the header") {
        std::string source = "package main\n";
        source += '\0';
        source += "import \"fmt\"\n";

        CHECK_THROWS_AS(parse(source), parse_error);
    }

    // ========================================
    // Files
    // ========================================

    TEST_CASE("Parsed files are registered") {
        file_set files;
        std::string source = "package main\nimport \"fmt\"\n";
        parse_header(files, "a.gop", source, source_dialect::gop);
        parse_header(files, "b.gop", "", source_dialect::gop);

        REQUIRE(files.size() == 2);
        CHECK(files.files()[0].name == "a.gop");
        CHECK(files.files()[0].size == source.size());
        CHECK(files.files()[1].name == "b.gop");
        CHECK(file_set::position(ast::source_pos("a.gop", 2, 8)) == "a.gop:2:8");
    }

    TEST_CASE("Parse file from disk") {
        file_set files;
        fs::path path = fs::path(UNITTEST_HOME) / "testdata" / "app" / "util" / "util.gop";

        auto header = parse_header(files, path, source_dialect::gop);

        REQUIRE(header.package.has_value());
        CHECK(header.package->name == "util");
        REQUIRE(header.imports.size() == 2);
        CHECK(header.imports[1].path.value == "\"./model\"");
    }

    TEST_CASE("Syntax error in file from disk") {
        file_set files;
        fs::path path = fs::path(UNITTEST_HOME) / "testdata" / "broken" / "bad_header.gop";

        try {
            parse_header(files, path, source_dialect::gop);
            FAIL("Expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.file() == path.string());
            CHECK(e.line() == 4);
            CHECK(e.column() == 8);
        }
    }

    TEST_CASE("Missing file") {
        file_set files;
        fs::path path = fs::path(UNITTEST_HOME) / "testdata" / "no_such_file.gop";

        try {
            parse_header(files, path, source_dialect::gop);
            FAIL("Expected file_read_error");
        } catch (const file_read_error& e) {
            CHECK(e.file() == path.string());
        }
        CHECK(files.size() == 0);
    }
}
