#pragma once
#include "credstream/chunked_file.hpp"
#include "credstream/line_reader.hpp"
#include "credstream/line_source.hpp"
#include "credstream/wordlists.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

enum class SourceKind { Literal, List, File };
enum class Slot { User, Password, Combo };

// A resolved user/password/combo source. Kind never changes once resolved.
struct CredentialSource {
  SourceKind kind = SourceKind::Literal;
  std::string value;                // literal value, or file path
  std::vector<std::string> values;  // list contents

  static CredentialSource literal(std::string v);
  static CredentialSource list(std::vector<std::string> v);
  static CredentialSource file(std::string path);
};

struct ResolveContext {
  Host host;
  std::string version;
  const WordlistProvider* wordlists = nullptr;  // null -> no defaults
  bool use_empty_password = false;
};

// existing file -> File; empty -> default wordlist (or {""} for the password
// slot under use_empty_password); anything else -> Literal.
CredentialSource resolve_source(std::string_view raw, Slot slot, const ResolveContext& ctx);

const char* slot_name(Slot slot) noexcept;

// Owns the read position over one resolved source.
class ValueCursor {
public:
  ValueCursor(CredentialSource src, ChunkedFile::Config chunking);
  ~ValueCursor();

  ValueCursor(const ValueCursor&) = delete;
  ValueCursor& operator=(const ValueCursor&) = delete;

  // No-op for literal and list sources.
  bool open(std::string* err_out = nullptr);

  ReadStatus next(std::string& out);

  // O(1) for literal/list; file sources go back to their first line.
  bool reset(std::string* err_out = nullptr);

  bool close(std::string* err_out = nullptr);

  SourceKind kind() const noexcept { return src_.kind; }
  const CredentialSource& source() const noexcept { return src_; }
  std::uint64_t bytes_read() const noexcept { return file_ ? file_->bytes_read() : 0; }
  bool is_chunked() const { return file_ && file_->is_chunked(); }
  std::size_t chunk_files() const { return is_chunked() ? file_->chunk_count() : 0; }
  const std::string& error() const noexcept { return err_; }

private:
  CredentialSource src_;
  ChunkedFile::Config chunking_;
  std::unique_ptr<FileLineSource> file_;
  std::size_t index_{0};
  std::string err_;
};

}
