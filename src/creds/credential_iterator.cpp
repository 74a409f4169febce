#include "credstream/credential_iterator.hpp"
#include "credstream/credential_source.hpp"
#include "credstream/metrics.hpp"

#include <memory>
#include <string>
#include <utility>

namespace cs {

struct CredentialIterator::Impl {
  Config cfg;

  bool initialized{false};
  bool done{false};
  bool failed{false};
  bool closed{false};

  std::unique_ptr<ValueCursor> users;
  std::unique_ptr<ValueCursor> passwords;
  std::unique_ptr<ValueCursor> combo;

  bool have_user{false};
  std::string current_user;
  std::string line;  // scratch for combo lines

  std::uint64_t emitted{0};
  std::uint64_t skipped{0};
  std::uint64_t bytes_reported{0};
  std::string err;

  explicit Impl(Config c) : cfg(std::move(c)) {}

  void log(LogLevel level, const std::string& msg) const { log_line(cfg.log, level, msg); }

  void flush_bytes() {
    if (!cfg.metrics) return;
    std::uint64_t total = 0;
    for (auto* c : {users.get(), passwords.get(), combo.get()})
      if (c) total += c->bytes_read();
    if (total > bytes_reported) {
      cfg.metrics->add_bytes(total - bytes_reported);
      bytes_reported = total;
    }
  }

  PullStatus fail(std::string msg, Slot slot) {
    done = true;
    failed = true;
    err = std::move(msg);
    log(LogLevel::Error, err);
    if (cfg.metrics) cfg.metrics->add_source_error(slot_name(slot));
    flush_bytes();
    return PullStatus::Failed;
  }

  PullStatus exhausted() {
    done = true;
    flush_bytes();
    return PullStatus::Exhausted;
  }

  bool open_cursor(std::unique_ptr<ValueCursor>& slot_cursor, CredentialSource src, Slot slot) {
    ChunkedFile::Config chunking = cfg.chunking;
    if (!chunking.log) chunking.log = cfg.log;  // one channel per iterator
    slot_cursor = std::make_unique<ValueCursor>(std::move(src), std::move(chunking));
    std::string e;
    if (!slot_cursor->open(&e)) {
      fail(std::string("error opening ") + slot_name(slot) + " file: " + e, slot);
      return false;
    }
    if (cfg.metrics) cfg.metrics->add_chunk_files(slot_cursor->chunk_files());
    return true;
  }

  // Runs once, on the first pull.
  bool initialize() {
    initialized = true;
    if (cfg.metrics) cfg.metrics->start_stage("resolve");

    ResolveContext ctx;
    ctx.host = cfg.host;
    ctx.version = cfg.version;
    ctx.wordlists = cfg.wordlists;
    ctx.use_empty_password = cfg.use_empty_password;

    bool ok = true;
    if (cfg.combo_mode()) {
      CredentialSource src = resolve_source(cfg.combo, Slot::Combo, ctx);
      if (src.kind == SourceKind::Literal && src.value.find(':') == std::string::npos) {
        fail("invalid combo format, expected user:password", Slot::Combo);
        ok = false;
      } else {
        ok = open_cursor(combo, std::move(src), Slot::Combo);
      }
    } else {
      // password-only services never touch the user slot
      if (!cfg.password_only)
        ok = open_cursor(users, resolve_source(cfg.user, Slot::User, ctx), Slot::User);
      if (ok)
        ok = open_cursor(passwords, resolve_source(cfg.password, Slot::Password, ctx), Slot::Password);
    }

    if (cfg.metrics) cfg.metrics->end_stage("resolve");
    return ok;
  }

  PullStatus next_combo(Credential& out) {
    while (true) {
      ReadStatus st = combo->next(line);
      if (st == ReadStatus::End) return exhausted();
      if (st == ReadStatus::Error) return fail("error reading combo file: " + combo->error(), Slot::Combo);

      const auto colon = line.find(':');
      if (colon == std::string::npos) {
        ++skipped;
        if (cfg.metrics) cfg.metrics->add_skipped();
        log(LogLevel::Warn, "skipping invalid format in combo file: " + line);
        continue;
      }
      out.user.assign(line, 0, colon);
      out.password.assign(line, colon + 1, std::string::npos);
      return PullStatus::Value;
    }
  }

  PullStatus next_password_only(Credential& out) {
    ReadStatus st = passwords->next(out.password);
    if (st == ReadStatus::End) return exhausted();
    if (st == ReadStatus::Error) return fail("error reading password file: " + passwords->error(), Slot::Password);
    out.user.clear();
    return PullStatus::Value;
  }

  // Returns Ok with current_user set, End, or Error (already reported).
  ReadStatus advance_user() {
    ReadStatus st = users->next(current_user);
    if (st == ReadStatus::Error) fail("error reading user file: " + users->error(), Slot::User);
    have_user = (st == ReadStatus::Ok);
    return st;
  }

  PullStatus next_standard(Credential& out) {
    if (!have_user) {
      ReadStatus st = advance_user();
      if (st == ReadStatus::End) return exhausted();
      if (st == ReadStatus::Error) return PullStatus::Failed;
    }

    ReadStatus st = passwords->next(out.password);
    if (st == ReadStatus::Ok) { out.user = current_user; return PullStatus::Value; }
    if (st == ReadStatus::Error) return fail("error reading password file: " + passwords->error(), Slot::Password);

    // Inner stream drained: rewind it and move to the next user.
    std::string e;
    if (!passwords->reset(&e)) return fail("error rewinding password source: " + e, Slot::Password);

    st = advance_user();
    if (st == ReadStatus::End) return exhausted();
    if (st == ReadStatus::Error) return PullStatus::Failed;

    st = passwords->next(out.password);
    if (st == ReadStatus::Ok) { out.user = current_user; return PullStatus::Value; }
    if (st == ReadStatus::Error) return fail("error reading password file: " + passwords->error(), Slot::Password);

    // empty password source: empty product
    return exhausted();
  }

  bool release(std::unique_ptr<ValueCursor>& c, bool ok, std::string* first) {
    if (!c) return ok;
    std::string e;
    if (!c->close(&e)) {
      log(LogLevel::Warn, "close failed: " + e);
      if (ok && first) *first = e;
      ok = false;
    }
    c.reset();
    return ok;
  }
};

CredentialIterator::CredentialIterator(Config cfg) : p_(new Impl(std::move(cfg))) {}

CredentialIterator::CredentialIterator(Host host, std::string user, std::string password,
                                       std::string combo, std::string version, bool password_only)
  : p_(nullptr) {
  Config cfg;
  cfg.host = std::move(host);
  cfg.user = std::move(user);
  cfg.password = std::move(password);
  cfg.combo = std::move(combo);
  cfg.version = std::move(version);
  cfg.password_only = password_only;
  p_ = new Impl(std::move(cfg));
}

CredentialIterator::~CredentialIterator() {
  std::string err;
  (void)close(&err);  // failures were already logged by close()
  delete p_;
}

PullStatus CredentialIterator::next(Credential& out) {
  if (p_->closed) return PullStatus::Exhausted;
  if (!p_->initialized && !p_->initialize()) return PullStatus::Failed;
  if (p_->done) return p_->failed ? PullStatus::Failed : PullStatus::Exhausted;

  PullStatus st;
  if (p_->combo)                  st = p_->next_combo(out);
  else if (p_->cfg.password_only) st = p_->next_password_only(out);
  else                            st = p_->next_standard(out);

  if (st == PullStatus::Value) {
    ++p_->emitted;
    if (p_->cfg.metrics) p_->cfg.metrics->add_emitted();
  }
  return st;
}

bool CredentialIterator::close(std::string* err_out) {
  if (p_->closed) return true;
  p_->flush_bytes();

  bool ok = true;
  ok = p_->release(p_->combo, ok, err_out);
  ok = p_->release(p_->users, ok, err_out);
  ok = p_->release(p_->passwords, ok, err_out);

  p_->closed = true;
  p_->done = true;
  return ok;
}

const CredentialIterator::Config& CredentialIterator::config() const noexcept { return p_->cfg; }
bool CredentialIterator::done() const noexcept { return p_->done; }
bool CredentialIterator::failed() const noexcept { return p_->failed; }
const std::string& CredentialIterator::error() const noexcept { return p_->err; }
std::uint64_t CredentialIterator::emitted() const noexcept { return p_->emitted; }
std::uint64_t CredentialIterator::skipped() const noexcept { return p_->skipped; }

}
