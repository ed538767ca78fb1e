#pragma once

#include <filesystem>
#include <functional>
#include <system_error>
#include <vector>

namespace gopdeps::driver {

/// Called for every directory that could not be read; the walk goes on
using walk_error_handler = std::function<void(const std::filesystem::path&, const std::error_code&)>;

/// Source files are regular .gop/.go files whose name does not start with '.'
bool is_source_file(const std::filesystem::directory_entry& entry);

/// Every source file below `root`, sorted.
/// Unreadable directories are reported through `on_error` and skipped.
std::vector<std::filesystem::path> find_source_files(const std::filesystem::path& root,
                                                     const walk_error_handler& on_error);

}  // namespace gopdeps::driver
