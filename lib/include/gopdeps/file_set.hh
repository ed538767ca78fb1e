//
// Registry of scanned source files, shared by every parse of a session.
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ast.hh"

namespace gopdeps {
    class file_set {
        public:
            struct file_info {
                std::string name;
                std::size_t size;  // Bytes read from the file
            };

            file_set() = default;

            file_set(const file_set&) = delete;
            file_set& operator =(const file_set&) = delete;

            // Registers a file; returns its index in files()
            std::size_t add_file(std::string name, std::size_t size);

            [[nodiscard]] const std::vector<file_info>& files() const { return files_; }
            [[nodiscard]] std::size_t size() const { return files_.size(); }

            // "file:line:column"
            [[nodiscard]] static std::string position(const ast::source_pos& pos);

        private:
            std::vector<file_info> files_;
    };
}
