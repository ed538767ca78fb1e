//
// Registry of scanned source files
//

#include <gopdeps/file_set.hh>

#include <sstream>
#include <utility>

namespace gopdeps {
    std::size_t file_set::add_file(std::string name, std::size_t size) {
        files_.push_back(file_info{std::move(name), size});
        return files_.size() - 1;
    }

    std::string file_set::position(const ast::source_pos& pos) {
        std::ostringstream oss;
        oss << pos.file << ":" << pos.line << ":" << pos.column;
        return oss.str();
    }
}
