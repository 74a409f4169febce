#include "credstream/chunk_sequencer.hpp"
#include "credstream/chunked_file.hpp"
#include "credstream/log.hpp"

namespace cs {

ChunkSequencer::ChunkSequencer(ChunkedFile& owner)
  : ChunkSequencer(owner, owner.config().reader) {}

ChunkSequencer::ChunkSequencer(ChunkedFile& owner, LineReader::Config cfg)
  : owner_(owner), chunks_(owner.chunk_paths()), reader_(cfg) {}

ChunkSequencer::~ChunkSequencer() {
  std::string err;
  if (!close(&err)) log_line(owner_.config().log, LogLevel::Warn, err);
}

ReadStatus ChunkSequencer::advance() {
  if (closed_) { err_ = "advance on closed sequencer"; return ReadStatus::Error; }
  // The last chunk stays open past End so restart() can seek it.
  if (next_ >= chunks_.size()) return ReadStatus::End;
  if (!reader_.close()) { err_ = reader_.error(); return ReadStatus::Error; }

  const std::size_t i = next_++;
  if (!reader_.open(chunks_[i])) {
    err_ = "failed to open chunk " + std::to_string(i) + ": " + reader_.error();
    return ReadStatus::Error;
  }
  return ReadStatus::Ok;
}

ReadStatus ChunkSequencer::restart() {
  if (closed_) { err_ = "restart on closed sequencer"; return ReadStatus::Error; }
  // Chunk 0 still open (the only chunk, or not yet left): seek it in place.
  // LineReader::rewind reopens by path only if the seek fails.
  if (next_ == 1 && reader_.is_open()) {
    if (!reader_.rewind()) { err_ = reader_.error(); return ReadStatus::Error; }
    return ReadStatus::Ok;
  }
  // A later chunk is open; chunk 0 was closed when we left it, so reopen.
  next_ = 0;
  return advance();
}

bool ChunkSequencer::close(std::string* err_out) {
  if (closed_) return true;
  closed_ = true;

  bool ok = true;
  if (!reader_.close()) {
    ok = false;
    if (err_out) *err_out = reader_.error();
  }
  std::string clean_err;
  if (!owner_.cleanup(&clean_err)) {
    if (ok && err_out) *err_out = clean_err;
    ok = false;
  }
  return ok;
}

}
