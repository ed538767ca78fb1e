//
// Go string literal decoding
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ast.hh"

namespace gopdeps {
    // Decodes a quoted literal ("...", `...` or '...').
    // Returns std::nullopt if the literal is malformed.
    std::optional<std::string> unquote(std::string_view literal);

    // Decodes the path literal of an import spec.
    // Throws grammar_invariant_error when the literal is not a string
    // literal or cannot be unquoted; the header parser never lets
    // either through, so callers are not expected to recover.
    std::string decode_string_literal(const ast::basic_lit& lit);
}
