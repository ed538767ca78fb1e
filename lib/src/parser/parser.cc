/*
 * Header parser - C++ Interface
 */

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <array>
#include <cstdlib>
#include <cstring>
#include <new>

#include <gopdeps/parser.hh>
#include <gopdeps/ast.hh>
#include <gopdeps/parser_error.hh>

#define GOPDEPS_PARSER_CONTEXT_VISIBLE
#include "parser/ast_builder.h"
#include "parser/ast_holder.hh"
#include "parser/scanner_context.h"
#include "parser/parser_context.h"
#include "parser/parser_constants.h"
#include "gen/gopdeps_parser.h"

/* Forward declarations for Lemon */
extern "C" {
void* ParseAlloc(void* (* allocProc)(size_t));
void Parse(void* parser, int token, token_value_t* value, parser_context_t* ctx);
void ParseFree(void* parser, void (* freeProc)(void*));
int parser_scan_token(scanner_context_t* ctx, parser_context_t* pctx, token_value_t* token);
}

namespace {
    class scanner {
        public:
            scanner(const char* input, size_t length, const char* filename) {
                m_ctx = new scanner_context_t;
                constexpr size_t PADDING = gopdeps::parser::INPUT_BUFFER_PADDING;
                char* padded_input = new char[length + PADDING];

                memcpy(padded_input, input, length);
                memset(padded_input + length, 0, PADDING); /* Fill padding with nulls */

                m_ctx->input = padded_input;
                m_ctx->cursor = padded_input;
                m_ctx->eof = padded_input + length; /* End of actual data */
                m_ctx->limit = padded_input + length + PADDING; /* End of buffer with padding */
                m_ctx->marker = padded_input;
                m_ctx->line = 1;
                m_ctx->column = 1;
                m_ctx->filename = filename ? filename : "<input>";
                m_ctx->insert_semicolon = 0;
            }

            ~scanner() {
                delete [] m_ctx->input;
                delete m_ctx;
            }

            scanner(const scanner&) = delete;
            scanner& operator =(const scanner&) = delete;

            int operator ()(token_value_t* token, parser_context_t* pctx) {
                return parser_scan_token(m_ctx, pctx, token);
            }

            scanner_context_t* get() {
                return m_ctx;
            }

        private:
            scanner_context_t* m_ctx;
    };

    class tokens_buffer {
        public:
            static constexpr int PARSER_TOKEN_POOL_SIZE = 256;
            static constexpr int PARSER_MAX_STACK_DEPTH = 64;

        public:
            tokens_buffer()
                : token_pool_index(0),
                  token_pool_start(0) {
            }

            std::pair <token_value_t*, int> get() {
                /* Calculate active window size */
                int active_tokens;
                if (token_pool_index >= token_pool_start) {
                    active_tokens = token_pool_index - token_pool_start;
                } else {
                    /* Wrapped around */
                    active_tokens = (PARSER_TOKEN_POOL_SIZE - token_pool_start) + token_pool_index;
                }

                /* Pool full: tokens older than the deepest parser stack are consumed */
                if (active_tokens >= PARSER_TOKEN_POOL_SIZE - 1) {
                    int reclaim_count = active_tokens - PARSER_MAX_STACK_DEPTH;
                    if (reclaim_count <= 0) {
                        return {nullptr, active_tokens};
                    }
                    token_pool_start = (token_pool_start + reclaim_count) % PARSER_TOKEN_POOL_SIZE;
                }

                /* Allocate from token pool with wraparound */
                auto* token = &token_pool[static_cast<size_t>(token_pool_index)];
                token_pool_index = (token_pool_index + 1) % PARSER_TOKEN_POOL_SIZE;
                return {token, active_tokens};
            }

        private:
            std::array <token_value_t, PARSER_TOKEN_POOL_SIZE> token_pool{};
            int token_pool_index;
            int token_pool_start; /* Start of active window */
    };

    class parser {
        public:
            parser()
                : m_parser(ParseAlloc(malloc)) {
                if (!m_parser) {
                    throw std::bad_alloc();
                }
            }

            ~parser() {
                ParseFree(m_parser, free);
            }

            parser(const parser&) = delete;
            parser& operator =(const parser&) = delete;

            void operator()(int token_type, token_value_t* token, parser_context_t* ctx) {
                Parse(m_parser, token_type, token, ctx);
            }

        private:
            void* m_parser;
    };

    /* Tokens that may start a declaration of the header */
    bool is_header_token(int token_type) {
        return token_type == TOKEN_PACKAGE || token_type == TOKEN_IMPORT;
    }
}

/*
 * Run parser. Feeds tokens until the first declaration that is not part of
 * the header; the rest of the file is never scanned.
 */
int parser_parse(parser& the_parser, parser_context_t& ctx, scanner& lexer) {
    tokens_buffer tokens;
    try {
        bool at_declaration = true;  /* Next token starts a top-level declaration */
        int paren_depth = 0;

        while (true) {
            auto [token, active_tokens] = tokens.get();
            if (!token) {
                parser_set_error(&ctx, PARSER_ERROR_MEMORY,
                                 "Token pool exhausted (size=%d, active=%d, max_stack=%d)",
                                 tokens_buffer::PARSER_TOKEN_POOL_SIZE, active_tokens,
                                 tokens_buffer::PARSER_MAX_STACK_DEPTH);
                return -1;
            }

            int token_type = lexer(token, &ctx);

            if (token_type == 0) {
                /* EOF */
                break;
            }

            if (token_type < 0) {
                /* Scanner error */
                return -1;
            }

            if (at_declaration && !is_header_token(token_type)) {
                /* End of header */
                break;
            }

            the_parser(token_type, token, &ctx);

            if (ctx.error.code != PARSER_OK) {
                return -1;
            }

            if (token_type == TOKEN_LPAREN) {
                ++paren_depth;
            } else if (token_type == TOKEN_RPAREN) {
                --paren_depth;
            }
            at_declaration = token_type == TOKEN_SEMICOLON && paren_depth == 0;
        }

        /* Send EOF to parser (token 0 in Lemon) */
        the_parser(0, nullptr, &ctx);

        return ctx.error.code == PARSER_OK ? 0 : -1;
    } catch (const std::exception& e) {
        parser_set_error(&ctx, PARSER_ERROR_INTERNAL, "C++ exception: %s", e.what());
        return -1;
    }
}

namespace gopdeps {
    // Build error message for parse_error: "file:line:column: message"
    std::string parse_error::build_message(const std::string& msg, const std::string& file,
                                           int line, int column) {
        std::ostringstream oss;
        oss << file << ":" << line << ":" << column << ": " << msg;
        return oss.str();
    }

    namespace {
        ast::file_header parse_header_impl(file_set& files, const std::string& input,
                                           const std::string& filename, source_dialect dialect) {
            files.add_file(filename, input.size());

            ::parser the_parser;

            scanner lexer(input.c_str(), input.length(), filename.c_str());
            parser_context ctx{};
            ctx.m_scanner = lexer.get();
            ast_header_holder holder{};
            holder.header = new ast::file_header(); // Holder manages header lifetime
            ctx.ast_builder = &holder;
            ctx.error = {};

            int result = parser_parse(the_parser, ctx, lexer);

            if (result != 0) {
                throw parse_error(ctx.error.message, filename, ctx.error.line, ctx.error.column);
            }

            if (dialect == source_dialect::go && !holder.header->package) {
                throw parse_error("expected 'package'", filename, 1, 1);
            }

            ast::file_header header = std::move(*ctx.ast_builder->header);
            return header;
        }
    } // anonymous namespace

    source_dialect dialect_for(const std::filesystem::path& path) {
        return path.extension() == ".go" ? source_dialect::go : source_dialect::gop;
    }

    ast::file_header parse_header(file_set& files, const std::filesystem::path& path, source_dialect dialect) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw file_read_error(path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw file_read_error(path.string());
        }

        return parse_header_impl(files, buffer.str(), path.string(), dialect);
    }

    ast::file_header parse_header(file_set& files, const std::string& filename, const std::string& text,
                                  source_dialect dialect) {
        return parse_header_impl(files, text, filename, dialect);
    }
} // namespace gopdeps
