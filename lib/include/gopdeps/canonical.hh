//
// Slash-separated path handling and import path canonicalization
//

#pragma once

#include <string>
#include <string_view>

#include "module.hh"

namespace gopdeps {
    /// Shortest path equivalent to `path` by purely lexical processing:
    /// repeated slashes collapse, "." elements vanish, ".." eats the
    /// preceding element. An empty result becomes ".".
    std::string clean_path(std::string_view path);

    /// Joins two path elements with '/' and cleans the result.
    /// Empty elements are ignored; joining two empty elements yields "".
    std::string join_path(std::string_view first, std::string_view second);

    /// True for ".", ".." and paths starting with "./" or "../"
    bool is_relative_import(std::string_view import_path);

    /// Relative import paths are resolved against the module root path,
    /// anything else is already canonical and returned unchanged.
    std::string canonical_import_path(std::string_view import_path, const module& mod);
}
