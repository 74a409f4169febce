#include "credstream/line_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace cs {

struct LineReader::Impl {
  Config cfg;
  std::string path;
  std::FILE* f{nullptr};
  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool eof{false};
  bool failed{false};
  std::string carry;
  std::string err;
  int last_errno{0};
  std::uint64_t bytes{0};

  void reset_buffer() {
    pos = len = 0;
    eof = false;
    failed = false;
    carry.clear();
  }

  bool fail(std::string msg, int e = 0) {
    failed = true;
    last_errno = e;
    err = std::move(msg);
    if (e != 0) { err += ": "; err += std::strerror(e); }
    return false;
  }

  bool open_path() {
    f = std::fopen(path.c_str(), "rb");
    if (!f) return fail("open failed: " + path, errno);
    if (buf.size() != cfg.buffer_bytes) buf.assign(cfg.buffer_bytes ? cfg.buffer_bytes : 1, 0);
    reset_buffer();
    err.clear();
    last_errno = 0;
    return true;
  }

  void emit(std::string& out) {
    if (cfg.strip_cr && !carry.empty() && carry.back() == '\r') carry.pop_back();
    out.swap(carry);
    carry.clear();
  }

  ReadStatus read_next(std::string& out) {
    if (failed) return ReadStatus::Error;
    if (!f) { fail("read on closed reader: " + path); return ReadStatus::Error; }

    carry.clear();
    while (true) {
      if (pos < len) {
        const char* s = buf.data() + pos;
        const std::size_t avail = len - pos;
        const void* nl = std::memchr(s, '\n', avail);
        const std::size_t take = nl ? static_cast<std::size_t>(static_cast<const char*>(nl) - s) : avail;
        if (carry.size() + take > cfg.max_line_bytes) {
          fail("line exceeds " + std::to_string(cfg.max_line_bytes) + " bytes in " + path);
          return ReadStatus::Error;
        }
        carry.append(s, take);
        pos += take;
        if (nl) { ++pos; emit(out); return ReadStatus::Ok; }
        continue;
      }

      if (eof) {
        // unterminated last line
        if (!carry.empty()) { emit(out); return ReadStatus::Ok; }
        return ReadStatus::End;
      }

      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0) {
        if (std::ferror(f)) { fail("read failed: " + path, errno); return ReadStatus::Error; }
        eof = true;
        continue;
      }
      bytes += n;
      pos = 0;
      len = n;
    }
  }

  bool rewind() {
    if (f && std::fseek(f, 0, SEEK_SET) == 0) {
      std::clearerr(f);
      reset_buffer();
      err.clear();
      return true;
    }
    if (f) { std::fclose(f); f = nullptr; }
    if (path.empty()) return fail("rewind on reader that was never opened");
    return open_path();
  }

  bool close() {
    if (!f) return true;
    int rc = std::fclose(f);
    f = nullptr;
    reset_buffer();
    if (rc != 0) return fail("close failed: " + path, errno);
    return true;
  }
};

LineReader::LineReader() : LineReader(Config{}) {}

LineReader::LineReader(Config cfg) : p_(new Impl{}) { p_->cfg = cfg; }

LineReader::~LineReader() {
  (void)p_->close();
  delete p_;
}

bool LineReader::open(const std::string& path) {
  if (!p_->close()) return false;
  p_->path = path;
  return p_->open_path();
}

ReadStatus LineReader::read_next(std::string& out) { return p_->read_next(out); }
bool LineReader::rewind() { return p_->rewind(); }
bool LineReader::close() { return p_->close(); }

bool LineReader::for_each_line(const LineCallback& cb) {
  std::string line;
  while (true) {
    ReadStatus st = p_->read_next(line);
    if (st == ReadStatus::End) return true;
    if (st == ReadStatus::Error) return false;
    if (!cb(line)) return true;
  }
}

bool LineReader::is_open() const noexcept { return p_->f != nullptr; }
const std::string& LineReader::path() const noexcept { return p_->path; }
const std::string& LineReader::error() const noexcept { return p_->err; }
int  LineReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineReader::bytes_read() const noexcept { return p_->bytes; }

}
