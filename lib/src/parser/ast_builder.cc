/*
 * C++ Bridge for the header parser
 * Provides extern "C" interface for C parser/lexer to call C++ AST building code
 */

#include <optional>
#include <string>
#include <string_view>

#include <gopdeps/literal.hh>

#define GOPDEPS_PARSER_CONTEXT_VISIBLE

#include "parser/ast_builder.h"
#include "parser/ast_holder.hh"
#include "parser/parser_context.h"

using namespace gopdeps::ast;

namespace {
    source_pos make_pos(parser_context_t* ctx, const token_value_t* tok) {
        return source_pos{
            ctx->m_scanner->filename,
            static_cast <size_t>(tok->line),
            static_cast <size_t>(tok->column)
        };
    }

    std::string token_text(const token_value_t* tok) {
        return std::string(tok->start, static_cast <size_t>(tok->end - tok->start));
    }

    /* Characters never allowed in an import path */
    constexpr std::string_view ILLEGAL_PATH_CHARS = "!\"#$%&'()*,:;<=>?[\\]^`{|}";
    constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;
    constexpr char32_t INVALID_RUNE = 0xFFFFFFFF;

    /* Decodes one UTF-8 sequence; malformed input yields INVALID_RUNE and consumes one byte */
    char32_t next_rune(std::string_view& in) {
        auto lead = static_cast <unsigned char>(in.front());
        if (lead < 0x80) {
            in.remove_prefix(1);
            return lead;
        }

        size_t length;
        char32_t rune;
        char32_t min_rune;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2; rune = lead & 0x1F; min_rune = 0x80;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3; rune = lead & 0x0F; min_rune = 0x800;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4; rune = lead & 0x07; min_rune = 0x10000;
        } else {
            in.remove_prefix(1);
            return INVALID_RUNE;
        }

        if (in.size() < length) {
            in.remove_prefix(1);
            return INVALID_RUNE;
        }
        for (size_t i = 1; i < length; ++i) {
            auto cont = static_cast <unsigned char>(in[i]);
            if ((cont & 0xC0) != 0x80) {
                in.remove_prefix(1);
                return INVALID_RUNE;
            }
            rune = (rune << 6) | (cont & 0x3F);
        }
        if (rune < min_rune || rune > 0x10FFFF || (rune >= 0xD800 && rune <= 0xDFFF)) {
            in.remove_prefix(1);
            return INVALID_RUNE;
        }
        in.remove_prefix(length);
        return rune;
    }

    /* Non-ASCII runes that are white space, controls or invisible formatting */
    bool is_hidden_rune(char32_t r) {
        return (r >= 0x80 && r <= 0xA0) ||
               r == 0xAD ||
               r == 0x1680 ||
               (r >= 0x2000 && r <= 0x200F) ||
               (r >= 0x2028 && r <= 0x202F) ||
               (r >= 0x205F && r <= 0x2064) ||
               r == 0x3000 ||
               r == 0xFEFF;
    }

    bool is_valid_import_path(std::string_view path) {
        if (path.empty()) {
            return false;
        }
        while (!path.empty()) {
            char32_t r = next_rune(path);
            if (r == INVALID_RUNE || r == REPLACEMENT_CHAR) {
                return false;
            }
            if (r <= 0x20 || r == 0x7F || is_hidden_rune(r)) {
                return false;
            }
            if (r < 0x80 && ILLEGAL_PATH_CHARS.find(static_cast <char>(r)) != std::string_view::npos) {
                return false;
            }
        }
        return true;
    }
}

/* Package clause */
void parser_build_package(parser_context_t* ctx, token_value_t* name_tok) {
    if (!ctx || !ctx->ast_builder || !name_tok) {
        return;
    }

    try {
        auto* holder = ctx->ast_builder;

        if (holder->header->package.has_value()) {
            parser_set_error_at(ctx, PARSER_ERROR_SEMANTIC, name_tok->line, name_tok->column,
                                "Package already declared");
            return;
        }

        holder->header->package = package_clause{
            make_pos(ctx, name_tok),
            token_text(name_tok)
        };
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build package: %s", e.what());
    }
}

/* Import spec */
void parser_build_import(parser_context_t* ctx, token_value_t* name_tok, token_value_t* path_tok) {
    if (!ctx || !ctx->ast_builder || !path_tok) {
        return;
    }

    try {
        std::string raw = token_text(path_tok);

        /* The scanner only checks escape syntax; code point ranges are checked here */
        std::optional<std::string> value = gopdeps::unquote(raw);
        if (!value) {
            parser_set_error_at(ctx, PARSER_ERROR_INVALID_LITERAL, path_tok->line, path_tok->column,
                                "invalid string literal: %s", raw.c_str());
            return;
        }

        if (!is_valid_import_path(*value)) {
            parser_set_error_at(ctx, PARSER_ERROR_SEMANTIC, path_tok->line, path_tok->column,
                                "invalid import path: %s", raw.c_str());
            return;
        }

        std::optional<std::string> name;
        if (name_tok) {
            name = token_text(name_tok);
        }

        import_spec spec{
            make_pos(ctx, name_tok ? name_tok : path_tok),
            std::move(name),
            basic_lit{make_pos(ctx, path_tok), lit_kind::string, std::move(raw)}
        };

        ctx->ast_builder->header->imports.push_back(std::move(spec));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build import: %s", e.what());
    }
}
