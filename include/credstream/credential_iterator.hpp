#pragma once
#include "credstream/chunked_file.hpp"
#include "credstream/log.hpp"
#include "credstream/wordlists.hpp"
#include <cstdint>
#include <string>

namespace cs {

class MetricsRegistry;

struct Credential {
  std::string user;
  std::string password;
};

// Value: `out` holds a pair. Exhausted: every pair was produced.
// Failed: a source could not be opened/read/reset, see error().
enum class PullStatus { Value, Exhausted, Failed };

// Pull-based (user, password) generator. Three traversal modes:
//   combo          pre-paired "user:password" entries (file or one literal)
//   password-only  passwords with an empty user
//   standard       user-major cross product, password stream rewound per user
// Construction does no I/O; sources are resolved and opened on the first
// next(). Single-threaded.
class CredentialIterator {
public:
  struct Config {
    Host host;
    std::string user;
    std::string password;
    std::string combo;
    std::string version;
    bool password_only = false;
    bool use_empty_password = false;
    ChunkedFile::Config chunking{};
    const WordlistProvider* wordlists = nullptr;  // not owned
    LogSink log;                                  // empty -> stderr
    MetricsRegistry* metrics = nullptr;           // not owned

    bool combo_mode() const noexcept { return !combo.empty(); }
  };

  explicit CredentialIterator(Config cfg);
  CredentialIterator(Host host, std::string user, std::string password,
                     std::string combo, std::string version, bool password_only);
  ~CredentialIterator();

  CredentialIterator(const CredentialIterator&) = delete;
  CredentialIterator& operator=(const CredentialIterator&) = delete;

  PullStatus next(Credential& out);

  // Release every handle and chunk directory. Returns the first failure
  // but still attempts the rest. Idempotent; later next() calls report
  // Exhausted.
  bool close(std::string* err_out = nullptr);

  const Config& config() const noexcept;
  bool done() const noexcept;
  bool failed() const noexcept;
  const std::string& error() const noexcept;
  std::uint64_t emitted() const noexcept;
  std::uint64_t skipped() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
