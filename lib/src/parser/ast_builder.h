/*
 * AST builder - extern "C" interface the generated parser calls to
 * record the package clause and import specs
 */

#ifndef AST_BUILDER_H
#define AST_BUILDER_H

#include <stddef.h>
#include "parser/parser_context.h"
#include "parser/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Package clause: package <name_tok> */
void parser_build_package(parser_context_t* ctx, token_value_t* name_tok);

/* Import spec: [name_tok] path_tok; name_tok is NULL when no local name is given */
void parser_build_import(parser_context_t* ctx, token_value_t* name_tok, token_value_t* path_tok);

#ifdef __cplusplus
}
#endif

#endif /* AST_BUILDER_H */
