//
// Error reporting and token names for the generated scanner and parser
//
#include <cstdarg>
#include <cstdio>

#define GOPDEPS_PARSER_CONTEXT_VISIBLE
#include "parser/parser_context.h"
#include "gen/gopdeps_parser.h"

namespace {
    void set_error(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                   const char* format, va_list args) {
        ctx->error.code = code;
        ctx->error.line = line;
        ctx->error.column = column;
        ctx->error.filename = ctx->m_scanner->filename;
        vsnprintf(ctx->error.message, sizeof(ctx->error.message), format, args);
    }
}

void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...) {
    if (!ctx) return;

    va_list args;
    va_start(args, format);
    set_error(ctx, code, ctx->m_scanner->line, ctx->m_scanner->column, format, args);
    va_end(args);
}

void parser_set_error_at(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                         const char* format, ...) {
    if (!ctx) return;

    va_list args;
    va_start(args, format);
    set_error(ctx, code, line, column, format, args);
    va_end(args);
}

enum parser_error_code parser_get_error_code(const parser_context_t* ctx) {
    if (!ctx) return PARSER_OK;
    return ctx->error.code;
}

const char* parser_get_token_name(int token_code) {
    switch (token_code) {
        case 0: return "end of file";
        case TOKEN_PACKAGE: return "'package'";
        case TOKEN_IMPORT: return "'import'";
        case TOKEN_IDENTIFIER: return "identifier";
        case TOKEN_STRING_LITERAL: return "string literal";
        case TOKEN_DOT: return "'.'";
        case TOKEN_SEMICOLON: return "';'";
        case TOKEN_LPAREN: return "'('";
        case TOKEN_RPAREN: return "')'";
        case TOKEN_OTHER: return "unexpected token";
        default: return "unknown token";
    }
}
