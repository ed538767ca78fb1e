//
// Parser context - shared by the generated scanner, the generated parser
// and the C++ AST builder
//

#pragma once
#include "parser/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Parser context */
typedef struct parser_context parser_context_t;

/* Error codes */
enum parser_error_code {
    PARSER_OK = 0,
    PARSER_ERROR_SYNTAX = 1,
    PARSER_ERROR_MEMORY = 2,
    PARSER_ERROR_INVALID_LITERAL = 4,
    PARSER_ERROR_SEMANTIC = 6,
    PARSER_ERROR_INTERNAL = 99
};

/* Error reporting */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...);

/* Same, at an explicit source position */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
void parser_set_error_at(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                         const char* format, ...);

/* Error recorded so far (PARSER_OK if none) */
enum parser_error_code parser_get_error_code(const parser_context_t* ctx);

/* Get human-readable token name */
const char* parser_get_token_name(int token_code);
#ifdef __cplusplus
}
#endif



#if defined(GOPDEPS_PARSER_CONTEXT_VISIBLE)
#include "parser/ast_holder.hh"
#include "parser/scanner_context.h"

/* Error context */
typedef struct parser_error {
    enum parser_error_code code;
    char message[256];
    int line;
    int column;
    const char* filename;
} parser_error_t;

typedef struct parser_context {
    /* Error handling */
    parser_error_t error;

    /* AST builder (C++ object) */
    ast_header_holder* ast_builder;
    scanner_context_t* m_scanner;
} parser_context_t;
#endif
