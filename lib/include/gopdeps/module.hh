//
// Module context: identity of the module owning the scanned files
//

#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gopdeps {
    class module {
        public:
            explicit module(std::string path, std::filesystem::path root_dir = {})
                : path_(std::move(path)), root_dir_(std::move(root_dir)) {
            }

            /// Canonical root import path, e.g. "example.com/app"
            [[nodiscard]] const std::string& path() const { return path_; }

            /// Directory holding the module marker file (empty if unknown)
            [[nodiscard]] const std::filesystem::path& root_dir() const { return root_dir_; }

        private:
            std::string path_;
            std::filesystem::path root_dir_;
    };

    struct module_options {
        // Tried in order in every directory
        std::vector<std::string> marker_files = {"gop.mod", "go.mod"};
    };

    // Extracts the path of the "module" directive from a marker file's text.
    // Throws module_error if there is none.
    std::string parse_module_directive(const std::string& text, const std::string& filename);

    // Finds the nearest directory at or above `start` holding a marker file
    // and loads the module declared there. Throws module_error.
    module load_module(const std::filesystem::path& start, const module_options& options = {});
}
