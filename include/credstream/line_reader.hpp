#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cs {

// Ok: a line (or chunk) was produced. End: clean exhaustion. Error: I/O or
// guard failure, see error().
enum class ReadStatus { Ok, End, Error };

class LineReader {
public:
  struct Config {
    std::size_t buffer_bytes   = 64 * 1024;    // 64 KiB read buffer
    std::size_t max_line_bytes = 1024 * 1024;  // 1 MiB guard per line
    bool        strip_cr       = true;         // trim trailing '\r' (CRLF)
  };

  LineReader();                  // uses default Config{}
  explicit LineReader(Config cfg);
  ~LineReader();

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  bool open(const std::string& path);

  // Pull the next line into `out`. Once Error is returned the reader stays
  // failed until it is reopened or rewound.
  ReadStatus read_next(std::string& out);

  // Back to offset 0. Falls back to reopening the stored path when the
  // seek fails; false if neither works.
  bool rewind();

  // Idempotent. False if the underlying fclose reported an error.
  bool close();

  // Returning false from the callback stops the walk early (not an error).
  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  bool is_open() const noexcept;
  const std::string& path() const noexcept;
  const std::string& error() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
