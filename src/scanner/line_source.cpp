#include "credstream/line_source.hpp"
#include "credstream/log.hpp"

namespace cs {

FileLineSource::FileLineSource(std::string path, ChunkedFile::Config cfg)
  : path_(std::move(path)),
    log_(cfg.log),
    file_(std::make_unique<ChunkedFile>(path_, std::move(cfg))) {}

FileLineSource::~FileLineSource() {
  std::string err;
  if (!close(&err)) log_line(log_, LogLevel::Warn, err);
}

bool FileLineSource::open(std::string* err_out) {
  if (seq_) return true;
  if (!file_) {
    err_ = "open on closed source: " + path_;
    if (err_out) *err_out = err_;
    return false;
  }
  if (!file_->prepare(&err_)) {
    if (err_out) *err_out = err_;
    return false;
  }
  seq_ = std::make_unique<ChunkSequencer>(*file_);
  exhausted_ = false;
  ReadStatus st = seq_->advance();
  if (st == ReadStatus::Error) {
    err_ = seq_->error();
    if (err_out) *err_out = err_;
    return false;
  }
  exhausted_ = (st == ReadStatus::End);
  return true;
}

ReadStatus FileLineSource::read_next(std::string& out) {
  if (!seq_) { err_ = "read on unopened source: " + path_; return ReadStatus::Error; }

  while (!exhausted_) {
    LineReader& r = seq_->current();
    const std::uint64_t before = r.bytes_read();
    ReadStatus st = r.read_next(out);
    bytes_ += r.bytes_read() - before;
    if (st == ReadStatus::Ok) return st;
    if (st == ReadStatus::Error) { err_ = r.error(); return st; }

    // chunk drained, move on
    st = seq_->advance();
    if (st == ReadStatus::Error) { err_ = seq_->error(); return st; }
    if (st == ReadStatus::End) exhausted_ = true;
  }
  return ReadStatus::End;
}

bool FileLineSource::reset(std::string* err_out) {
  if (!seq_) {
    err_ = "reset on unopened source: " + path_;
    if (err_out) *err_out = err_;
    return false;
  }
  ReadStatus st = seq_->restart();
  if (st == ReadStatus::Error) {
    err_ = seq_->error();
    if (err_out) *err_out = err_;
    return false;
  }
  exhausted_ = (st == ReadStatus::End);
  return true;
}

bool FileLineSource::close(std::string* err_out) {
  bool ok = true;
  if (seq_) {
    ok = seq_->close(err_out);
    seq_.reset();
  }
  if (file_) {
    // covers a prepare() that chunked but never got a sequencer
    std::string err;
    if (!file_->cleanup(&err)) {
      if (ok && err_out) *err_out = err;
      ok = false;
    }
    file_.reset();
  }
  exhausted_ = true;
  return ok;
}

bool FileLineSource::is_chunked() const {
  return file_ && file_->is_chunked();
}

}
