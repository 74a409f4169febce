#pragma once
#include "credstream/line_reader.hpp"
#include "credstream/log.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

// A wordlist file, possibly split into ordered chunk files under an owned
// temp directory. Chunk contents concatenated in order reproduce the
// original line sequence; no line straddles two chunks.
class ChunkedFile {
public:
  struct Config {
    std::uint64_t large_file_threshold = 1ull << 30;          // 1 GiB
    std::uint64_t chunk_bytes          = 500ull * 1024 * 1024; // 500 MiB
    bool          disable_chunking     = false;
    std::string   temp_root;            // empty -> system temp dir
    LineReader::Config reader{};        // line discipline used while splitting
    LogSink       log;                  // chunking diagnostics; empty -> stderr
  };

  explicit ChunkedFile(std::string path);  // uses default Config{}
  ChunkedFile(std::string path, Config cfg);
  ~ChunkedFile();                          // best-effort cleanup()

  ChunkedFile(const ChunkedFile&) = delete;
  ChunkedFile& operator=(const ChunkedFile&) = delete;

  // Decide and, for large files, split. Runs once; later calls return the
  // first outcome. On failure no temp directory is left behind.
  bool prepare(std::string* err_out = nullptr);

  // Remove the owned temp directory. No-op for unchunked files. Idempotent.
  bool cleanup(std::string* err_out = nullptr);

  std::vector<std::string> chunk_paths() const;
  bool is_chunked() const;
  std::string temp_dir() const;

  const std::string& original_path() const noexcept { return path_; }
  const Config& config() const noexcept { return cfg_; }

private:
  bool create_chunks_locked(std::string* err_out);

  const std::string path_;
  const Config cfg_;

  mutable std::mutex mu_;
  std::vector<std::string> chunks_;
  std::string temp_dir_;
  bool chunked_{false};
  bool prepared_{false};
  bool prepare_ok_{false};
  std::string prepare_err_;
};

// Whole-file helpers over the current chunk list, in order.
std::optional<std::uint64_t> count_lines(const ChunkedFile& cf, std::string* err_out = nullptr);

// Callback returns false to stop early.
bool read_lines(const ChunkedFile& cf,
                const std::function<bool(std::string_view)>& cb,
                std::string* err_out = nullptr);

}
