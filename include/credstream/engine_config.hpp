#pragma once
#include "credstream/chunked_file.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Settings shared by every iterator and counting pass in one run.
//
// {
//   "chunking": { "enabled": true, "large_file_threshold": "1GiB",
//                 "chunk_size": "500MiB", "temp_root": "/var/tmp" },
//   "lines":    { "buffer_size": "64KiB", "max_line_length": "1MiB", "strip_cr": true },
//   "use_empty_password": false,
//   "wordlists": "wordlists.json"
// }
struct EngineConfig {
  ChunkedFile::Config chunking{};
  bool use_empty_password = false;
  std::string wordlists_path;
};

// "4096", "64KiB", "500MiB", "1GiB", "1.5G" (binary multiples). nullopt on
// junk, negatives or overflow.
std::optional<std::uint64_t> parse_size(std::string_view s);

// Fields absent from the document keep their current value in `out`.
bool load_engine_config(const std::string& path, EngineConfig& out,
                        std::string* err_out = nullptr);
bool parse_engine_config(std::string_view json, EngineConfig& out,
                         std::string* err_out = nullptr);

}
