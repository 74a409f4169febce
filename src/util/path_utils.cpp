#include "credstream/path_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace cs {

bool is_regular_file(std::string_view path) {
  if (path.empty()) return false;
  std::error_code ec;
  return std::filesystem::is_regular_file(std::filesystem::path(std::string(path)), ec);
}

std::optional<std::uint64_t> file_size(const std::string& path, std::string* err_out) {
  std::error_code ec;
  auto n = std::filesystem::file_size(path, ec);
  if (ec) {
    if (err_out) *err_out = "failed to stat " + path + ": " + ec.message();
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(n);
}

bool make_temp_dir(const std::string& root, std::string_view prefix,
                   std::filesystem::path* out, std::string* err_out) {
  std::error_code ec;
  std::filesystem::path base = root.empty()
      ? std::filesystem::temp_directory_path(ec)
      : std::filesystem::path(root);
  if (ec) {
    if (err_out) *err_out = "no temp directory: " + ec.message();
    return false;
  }

  // mkdtemp wants a writable, NUL-terminated template ending in XXXXXX
  std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    if (err_out) *err_out = "failed to create temp directory under " + base.string() + ": " + std::strerror(errno);
    return false;
  }
  *out = std::filesystem::path(buf.data());
  return true;
}

bool remove_tree(const std::filesystem::path& dir, std::string* err_out) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    if (err_out) *err_out = "failed to remove " + dir.string() + ": " + ec.message();
    return false;
  }
  return true;
}

std::string chunk_file_name(std::size_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "chunk_%04zu.txt", index);
  return name;
}

}
