#include "credstream/credential_source.hpp"
#include "credstream/log.hpp"
#include "credstream/path_utils.hpp"

namespace cs {

CredentialSource CredentialSource::literal(std::string v) {
  CredentialSource s;
  s.kind = SourceKind::Literal;
  s.value = std::move(v);
  return s;
}

CredentialSource CredentialSource::list(std::vector<std::string> v) {
  CredentialSource s;
  s.kind = SourceKind::List;
  s.values = std::move(v);
  return s;
}

CredentialSource CredentialSource::file(std::string path) {
  CredentialSource s;
  s.kind = SourceKind::File;
  s.value = std::move(path);
  return s;
}

const char* slot_name(Slot slot) noexcept {
  switch (slot) {
    case Slot::User:     return "user";
    case Slot::Password: return "password";
    case Slot::Combo:    return "combo";
  }
  return "?";
}

CredentialSource resolve_source(std::string_view raw, Slot slot, const ResolveContext& ctx) {
  if (is_regular_file(raw)) return CredentialSource::file(std::string(raw));
  if (!raw.empty()) return CredentialSource::literal(std::string(raw));

  if (slot == Slot::Password && ctx.use_empty_password)
    return CredentialSource::list({std::string()});
  if (!ctx.wordlists || slot == Slot::Combo)
    return CredentialSource::list({});
  if (slot == Slot::User)
    return CredentialSource::list(ctx.wordlists->users(ctx.version, ctx.host.service));
  return CredentialSource::list(ctx.wordlists->passwords(ctx.version, ctx.host.service));
}

ValueCursor::ValueCursor(CredentialSource src, ChunkedFile::Config chunking)
  : src_(std::move(src)), chunking_(std::move(chunking)) {}

ValueCursor::~ValueCursor() {
  std::string err;
  if (!close(&err)) log_line(chunking_.log, LogLevel::Warn, err);
}

bool ValueCursor::open(std::string* err_out) {
  if (src_.kind != SourceKind::File || file_) return true;
  file_ = std::make_unique<FileLineSource>(src_.value, chunking_);
  if (!file_->open(&err_)) {
    if (err_out) *err_out = err_;
    return false;
  }
  return true;
}

ReadStatus ValueCursor::next(std::string& out) {
  switch (src_.kind) {
    case SourceKind::Literal:
      if (index_ > 0) return ReadStatus::End;
      ++index_;
      out = src_.value;
      return ReadStatus::Ok;
    case SourceKind::List:
      if (index_ >= src_.values.size()) return ReadStatus::End;
      out = src_.values[index_++];
      return ReadStatus::Ok;
    case SourceKind::File: {
      if (!file_) { err_ = "read before open: " + src_.value; return ReadStatus::Error; }
      ReadStatus st = file_->read_next(out);
      if (st == ReadStatus::Error) err_ = file_->error();
      return st;
    }
  }
  return ReadStatus::Error;
}

bool ValueCursor::reset(std::string* err_out) {
  if (src_.kind != SourceKind::File) {
    index_ = 0;
    return true;
  }
  if (!file_) {
    err_ = "reset before open: " + src_.value;
    if (err_out) *err_out = err_;
    return false;
  }
  if (!file_->reset(&err_)) {
    if (err_out) *err_out = err_;
    return false;
  }
  return true;
}

bool ValueCursor::close(std::string* err_out) {
  if (!file_) return true;
  bool ok = file_->close(&err_);
  file_.reset();
  if (!ok && err_out) *err_out = err_;
  return ok;
}

}
