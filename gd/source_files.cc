#include "source_files.hh"
#include <algorithm>
#include <string>

namespace fs = std::filesystem;

namespace gopdeps::driver {

bool is_source_file(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    const fs::path& path = entry.path();
    std::string name = path.filename().string();
    if (name.empty() || name.front() == '.') {
        return false;
    }
    return path.extension() == ".gop" || path.extension() == ".go";
}

std::vector<fs::path> find_source_files(const fs::path& root, const walk_error_handler& on_error) {
    std::vector<fs::path> sources;
    std::vector<fs::path> pending{root};

    // Each directory is read on its own so one failure only loses that directory
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
                pending.push_back(it->path());
            } else if (is_source_file(*it)) {
                sources.push_back(it->path());
            }
        }
        if (ec) {
            on_error(dir, ec);
        }
    }

    // Directory order is unspecified; keep diagnostics reproducible
    std::sort(sources.begin(), sources.end());
    return sources;
}

}  // namespace gopdeps::driver
