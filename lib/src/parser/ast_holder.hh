//
// Holder for the header under construction while the parser runs
//

#pragma once

#include <gopdeps/ast.hh>

struct ast_header_holder {
    gopdeps::ast::file_header* header;  // Pointer to header (holder owns it)

    ~ast_header_holder() {
        delete header;
    }
};
