#pragma once
#include "credstream/chunk_sequencer.hpp"
#include "credstream/chunked_file.hpp"
#include "credstream/line_reader.hpp"
#include "credstream/log.hpp"
#include <memory>
#include <string>

namespace cs {

// One logical line stream over a file, whether or not it was split into
// chunks. Callers never see chunk boundaries.
class FileLineSource {
public:
  FileLineSource(std::string path, ChunkedFile::Config cfg);
  ~FileLineSource();

  FileLineSource(const FileLineSource&) = delete;
  FileLineSource& operator=(const FileLineSource&) = delete;

  // Prepare chunks (if any) and open the first one.
  bool open(std::string* err_out = nullptr);

  ReadStatus read_next(std::string& out);

  // Back to the first line of the logical file.
  bool reset(std::string* err_out = nullptr);

  // Release the open handle and any chunk directory. Idempotent.
  bool close(std::string* err_out = nullptr);

  bool is_chunked() const;
  std::size_t chunk_count() const noexcept { return seq_ ? seq_->chunk_count() : 0; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }
  const std::string& path() const noexcept { return path_; }
  const std::string& error() const noexcept { return err_; }

private:
  std::string path_;
  LogSink log_;
  std::unique_ptr<ChunkedFile> file_;
  std::unique_ptr<ChunkSequencer> seq_;
  std::uint64_t bytes_{0};
  bool exhausted_{false};
  std::string err_;
};

}
