#include "credstream/chunked_file.hpp"
#include "credstream/log.hpp"
#include "credstream/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace cs {

ChunkedFile::ChunkedFile(std::string path)
  : ChunkedFile(std::move(path), Config{}) {}

ChunkedFile::ChunkedFile(std::string path, Config cfg)
  : path_(std::move(path)), cfg_(std::move(cfg)) {}

ChunkedFile::~ChunkedFile() {
  std::string err;
  if (!cleanup(&err)) log_line(cfg_.log, LogLevel::Warn, err);
}

bool ChunkedFile::prepare(std::string* err_out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (prepared_) {
    if (!prepare_ok_ && err_out) *err_out = prepare_err_;
    return prepare_ok_;
  }
  prepared_ = true;

  if (cfg_.disable_chunking) {
    chunks_ = {path_};
    prepare_ok_ = true;
    return true;
  }

  auto size = file_size(path_, &prepare_err_);
  if (!size) {
    if (err_out) *err_out = prepare_err_;
    return false;
  }

  if (*size < cfg_.large_file_threshold) {
    chunks_ = {path_};
    prepare_ok_ = true;
    return true;
  }

  log_line(cfg_.log, LogLevel::Info, "large file detected (" + std::to_string(*size / (1024 * 1024)) +
                                     " MB), creating chunks: " + path_);
  prepare_ok_ = create_chunks_locked(&prepare_err_);
  if (!prepare_ok_ && err_out) *err_out = prepare_err_;
  return prepare_ok_;
}

bool ChunkedFile::create_chunks_locked(std::string* err_out) {
  std::filesystem::path dir;
  if (!make_temp_dir(cfg_.temp_root, "credstream-chunks-", &dir, err_out)) return false;

  // Any failure below drops the partial directory.
  auto abandon = [&](std::string msg) {
    std::string rm_err;
    if (!remove_tree(dir, &rm_err)) msg += " (" + rm_err + ")";
    if (err_out) *err_out = std::move(msg);
    return false;
  };

  LineReader in(cfg_.reader);
  if (!in.open(path_)) return abandon(in.error());

  std::vector<std::string> paths;
  std::ofstream out;
  std::uint64_t current = 0;
  std::string line;

  while (true) {
    ReadStatus st = in.read_next(line);
    if (st == ReadStatus::End) break;
    if (st == ReadStatus::Error) return abandon("error reading " + path_ + ": " + in.error());

    const std::uint64_t line_size = line.size() + 1; // + newline
    if (!out.is_open() || (current > 0 && current + line_size > cfg_.chunk_bytes)) {
      if (out.is_open()) {
        out.close();
        if (out.fail()) return abandon("failed to finish chunk " + paths.back());
      }
      paths.push_back((dir / chunk_file_name(paths.size())).string());
      out.open(paths.back(), std::ios::binary | std::ios::trunc);
      if (!out) return abandon("failed to create chunk file " + paths.back());
      current = 0;
    }

    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.put('\n');
    if (!out) return abandon("failed to write to chunk " + paths.back());
    current += line_size;
  }

  if (out.is_open()) {
    out.close();
    if (out.fail()) return abandon("failed to finish chunk " + paths.back());
  }
  if (!in.close()) return abandon(in.error());

  temp_dir_ = dir.string();
  chunks_ = std::move(paths);
  chunked_ = true;
  log_line(cfg_.log, LogLevel::Info, "created " + std::to_string(chunks_.size()) + " chunks in " + temp_dir_);
  return true;
}

bool ChunkedFile::cleanup(std::string* err_out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!chunked_ || temp_dir_.empty()) return true;

  if (!remove_tree(temp_dir_, err_out)) return false;

  temp_dir_.clear();
  chunks_.clear();
  chunked_ = false;
  return true;
}

std::vector<std::string> ChunkedFile::chunk_paths() const {
  std::lock_guard<std::mutex> lk(mu_);
  return chunks_;
}

bool ChunkedFile::is_chunked() const {
  std::lock_guard<std::mutex> lk(mu_);
  return chunked_;
}

std::string ChunkedFile::temp_dir() const {
  std::lock_guard<std::mutex> lk(mu_);
  return temp_dir_;
}

bool read_lines(const ChunkedFile& cf,
                const std::function<bool(std::string_view)>& cb,
                std::string* err_out) {
  bool keep_going = true;
  for (const auto& chunk : cf.chunk_paths()) {
    LineReader r(cf.config().reader);
    if (!r.open(chunk)) {
      if (err_out) *err_out = "failed to open chunk: " + r.error();
      return false;
    }
    bool ok = r.for_each_line([&](std::string_view s){
      keep_going = cb(s);
      return keep_going;
    });
    if (!ok) {
      if (err_out) *err_out = "error reading chunk: " + r.error();
      return false;
    }
    if (!r.close()) {
      if (err_out) *err_out = r.error();
      return false;
    }
    if (!keep_going) break;
  }
  return true;
}

std::optional<std::uint64_t> count_lines(const ChunkedFile& cf, std::string* err_out) {
  std::uint64_t n = 0;
  if (!read_lines(cf, [&](std::string_view){ ++n; return true; }, err_out)) return std::nullopt;
  return n;
}

}
