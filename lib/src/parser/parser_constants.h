//
// Parser constants - named constants to replace magic numbers
//

#ifndef GOPDEPS_PARSER_CONSTANTS_H
#define GOPDEPS_PARSER_CONSTANTS_H

#include <cstddef>

namespace gopdeps::parser {

/* Buffer configuration */
constexpr size_t INPUT_BUFFER_PADDING = 32;  // Bytes of padding for re2c lookahead

} // namespace gopdeps::parser

#endif // GOPDEPS_PARSER_CONSTANTS_H
