//
// Tests for path cleaning and import path canonicalization
//

#include <gopdeps/canonical.hh>
#include <gopdeps/module.hh>
#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace gopdeps;

TEST_SUITE("Path Canonicalizer") {

    // ========================================
    // clean_path / join_path
    // ========================================

    TEST_CASE("clean_path") {
        CHECK(clean_path("") == ".");
        CHECK(clean_path("abc") == "abc");
        CHECK(clean_path("abc/def") == "abc/def");
        CHECK(clean_path("a/b/c/") == "a/b/c");
        CHECK(clean_path("a//b") == "a/b");
        CHECK(clean_path("/abc//def") == "/abc/def");
        CHECK(clean_path("a/./b") == "a/b");
        CHECK(clean_path("./") == ".");
        CHECK(clean_path("/") == "/");
        CHECK(clean_path("a/b/../c") == "a/c");
        CHECK(clean_path("abc/./../def") == "def");
        CHECK(clean_path("a/..") == ".");
    }

    TEST_CASE("clean_path - leading parent elements") {
        CHECK(clean_path("../a") == "../a");
        CHECK(clean_path("../../abc") == "../../abc");
        CHECK(clean_path("a/../..") == "..");
        CHECK(clean_path("a/b/../../..") == "..");
        CHECK(clean_path("/../a") == "/a");
        CHECK(clean_path("/..") == "/");
    }

    TEST_CASE("join_path") {
        CHECK(join_path("a", "b") == "a/b");
        CHECK(join_path("a/", "b") == "a/b");
        CHECK(join_path("a", "") == "a");
        CHECK(join_path("", "b") == "b");
        CHECK(join_path("", "") == "");
        CHECK(join_path("a/b", "../c") == "a/c");
    }

    // ========================================
    // Relative import detection
    // ========================================

    TEST_CASE("is_relative_import") {
        CHECK(is_relative_import("."));
        CHECK(is_relative_import(".."));
        CHECK(is_relative_import("./x"));
        CHECK(is_relative_import("../x"));
        CHECK(is_relative_import("./"));

        CHECK_FALSE(is_relative_import(""));
        CHECK_FALSE(is_relative_import("fmt"));
        CHECK_FALSE(is_relative_import(".hidden"));
        CHECK_FALSE(is_relative_import("..x"));
        CHECK_FALSE(is_relative_import("x/./y"));
        CHECK_FALSE(is_relative_import("/abs/path"));
    }

    // ========================================
    // canonical_import_path
    // ========================================

    TEST_CASE("Absolute import paths are unchanged for every module") {
        const std::vector<std::string> paths = {
            "fmt", "github.com/goplus/gop/ast", "example.com/app/util", ".hidden", "a//b", "/x"
        };
        const std::vector<module> modules = {
            module("example.com/app"), module("example.com/proj/pkg"), module("")
        };

        for (const auto& mod : modules) {
            for (const auto& path : paths) {
                CAPTURE(mod.path());
                CAPTURE(path);
                CHECK(canonical_import_path(path, mod) == path);
            }
        }
    }

    TEST_CASE("Relative import paths join the module root") {
        CHECK(canonical_import_path("./sub", module("example.com/proj")) == "example.com/proj/sub");
        CHECK(canonical_import_path("../sibling", module("example.com/proj/pkg")) == "example.com/proj/sibling");
        CHECK(canonical_import_path("./util", module("example.com/app")) == "example.com/app/util");
        CHECK(canonical_import_path(".", module("example.com/app")) == "example.com/app");
        CHECK(canonical_import_path("./a/b/", module("example.com/app")) == "example.com/app/a/b");
    }

    TEST_CASE("Equivalent relative paths canonicalize identically") {
        module mod("example.com/app");
        const std::string expected = canonical_import_path("./sub", mod);

        CHECK(canonical_import_path("./sub/", mod) == expected);
        CHECK(canonical_import_path("./a/../sub", mod) == expected);
        CHECK(canonical_import_path("./././sub", mod) == expected);
        CHECK(canonical_import_path("./sub//", mod) == expected);
    }

    TEST_CASE("Escaping above the module root gives the joined path") {
        CHECK(canonical_import_path("../../x", module("example.com")) == "../x");
        CHECK(canonical_import_path("../x", module("example.com")) == "x");
    }

    TEST_CASE("Empty module root") {
        CHECK(canonical_import_path("./x", module("")) == "x");
    }
}
