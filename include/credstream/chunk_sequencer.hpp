#pragma once
#include "credstream/line_reader.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cs {

class ChunkedFile;

// Walks a ChunkedFile's chunks in order with at most one open handle.
// The ChunkedFile must outlive the sequencer.
class ChunkSequencer {
public:
  explicit ChunkSequencer(ChunkedFile& owner);
  ChunkSequencer(ChunkedFile& owner, LineReader::Config cfg);
  ~ChunkSequencer();

  ChunkSequencer(const ChunkSequencer&) = delete;
  ChunkSequencer& operator=(const ChunkSequencer&) = delete;

  // Close the open chunk and open the next. Ok -> current() reads it,
  // End -> no chunks left (the last chunk stays open until restart() or
  // close()), Error -> open failed (see error()).
  ReadStatus advance();

  // Position at the first line of the first chunk again.
  ReadStatus restart();

  // Close any open chunk and run the owner's cleanup() exactly once.
  bool close(std::string* err_out = nullptr);

  LineReader& current() noexcept { return reader_; }
  std::size_t chunk_count() const noexcept { return chunks_.size(); }
  // Chunks opened so far in this pass.
  std::size_t position() const noexcept { return next_; }
  const std::string& error() const noexcept { return err_; }

private:
  ChunkedFile& owner_;
  std::vector<std::string> chunks_;
  LineReader reader_;
  std::size_t next_{0};
  bool closed_{false};
  std::string err_;
};

}
