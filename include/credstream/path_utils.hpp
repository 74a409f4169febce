#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// True when `path` names an existing regular file (symlinks followed).
bool is_regular_file(std::string_view path);

// Size in bytes, or nullopt with the reason in *err_out.
std::optional<std::uint64_t> file_size(const std::string& path,
                                       std::string* err_out = nullptr);

// Create a fresh, uniquely named directory "<root>/<prefix>XXXXXX".
// An empty root means std::filesystem::temp_directory_path().
bool make_temp_dir(const std::string& root, std::string_view prefix,
                   std::filesystem::path* out, std::string* err_out = nullptr);

// Recursively remove `dir`; a missing directory counts as removed.
bool remove_tree(const std::filesystem::path& dir, std::string* err_out = nullptr);

// "chunk_0007.txt"
std::string chunk_file_name(std::size_t index);

}
