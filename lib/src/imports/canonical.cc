//
// Slash-separated path handling and import path canonicalization
//

#include <gopdeps/canonical.hh>

namespace gopdeps {
    std::string clean_path(std::string_view path) {
        if (path.empty()) {
            return ".";
        }

        const bool rooted = path.front() == '/';
        const std::size_t n = path.size();

        std::string out;
        out.reserve(n);

        std::size_t r = 0;
        std::size_t dotdot = 0;  // Index in `out` where ".." must stop backtracking
        if (rooted) {
            out += '/';
            r = 1;
            dotdot = 1;
        }

        while (r < n) {
            if (path[r] == '/') {
                // Empty element
                ++r;
            } else if (path[r] == '.' && (r + 1 == n || path[r + 1] == '/')) {
                // "." element
                ++r;
            } else if (path[r] == '.' && path[r + 1] == '.' && (r + 2 == n || path[r + 2] == '/')) {
                // ".." element: remove up to the last '/'
                r += 2;
                if (out.size() > dotdot) {
                    std::size_t w = out.size() - 1;
                    while (w > dotdot && out[w] != '/') {
                        --w;
                    }
                    out.resize(w);
                } else if (!rooted) {
                    // Cannot backtrack; keep the leading ".."
                    if (!out.empty()) {
                        out += '/';
                    }
                    out += "..";
                    dotdot = out.size();
                }
            } else {
                // Real element
                if ((rooted && out.size() != 1) || (!rooted && !out.empty())) {
                    out += '/';
                }
                for (; r < n && path[r] != '/'; ++r) {
                    out += path[r];
                }
            }
        }

        if (out.empty()) {
            return ".";
        }
        return out;
    }

    std::string join_path(std::string_view first, std::string_view second) {
        if (first.empty() && second.empty()) {
            return {};
        }
        if (first.empty()) {
            return clean_path(second);
        }
        if (second.empty()) {
            return clean_path(first);
        }

        std::string joined;
        joined.reserve(first.size() + 1 + second.size());
        joined.append(first);
        joined += '/';
        joined.append(second);
        return clean_path(joined);
    }

    bool is_relative_import(std::string_view import_path) {
        return import_path == "." || import_path == ".." ||
               import_path.substr(0, 2) == "./" || import_path.substr(0, 3) == "../";
    }

    std::string canonical_import_path(std::string_view import_path, const module& mod) {
        if (is_relative_import(import_path)) {
            return join_path(mod.path(), import_path);
        }
        return std::string(import_path);
    }
}
