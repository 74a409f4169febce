#include "credstream/counting.hpp"
#include "credstream/credential_source.hpp"

namespace cs {

std::optional<std::uint64_t> count_matching_lines(const std::string& path,
                                                  const LineReader::Config& cfg,
                                                  const std::function<bool(std::string_view)>& keep,
                                                  std::string* err_out) {
  LineReader r(cfg);
  if (!r.open(path)) {
    if (err_out) *err_out = "error opening file for counting: " + r.error();
    return std::nullopt;
  }
  std::uint64_t n = 0;
  bool ok = r.for_each_line([&](std::string_view s){
    if (keep(s)) ++n;
    return true;
  });
  if (!ok) {
    if (err_out) *err_out = "error reading file for counting: " + r.error();
    return std::nullopt;
  }
  if (!r.close()) {
    if (err_out) *err_out = r.error();
    return std::nullopt;
  }
  return n;
}

std::optional<std::uint64_t> count_lines(const std::string& path,
                                         const LineReader::Config& cfg,
                                         std::string* err_out) {
  return count_matching_lines(path, cfg, [](std::string_view){ return true; }, err_out);
}

static std::optional<std::uint64_t> source_size(const CredentialSource& src,
                                                const LineReader::Config& cfg,
                                                std::string* err_out) {
  switch (src.kind) {
    case SourceKind::Literal: return 1;
    case SourceKind::List:    return src.values.size();
    case SourceKind::File:    return count_lines(src.value, cfg, err_out);
  }
  return std::nullopt;
}

std::optional<std::uint64_t> count_credentials(const CredentialIterator::Config& cfg,
                                               std::string* err_out) {
  ResolveContext ctx;
  ctx.host = cfg.host;
  ctx.version = cfg.version;
  ctx.wordlists = cfg.wordlists;
  ctx.use_empty_password = cfg.use_empty_password;
  const LineReader::Config& lines = cfg.chunking.reader;

  if (cfg.combo_mode()) {
    CredentialSource src = resolve_source(cfg.combo, Slot::Combo, ctx);
    auto has_colon = [](std::string_view s){ return s.find(':') != std::string_view::npos; };
    if (src.kind == SourceKind::File)
      return count_matching_lines(src.value, lines, has_colon, err_out);
    // a literal without ':' is rejected by the iterator
    return has_colon(src.value) ? 1 : 0;
  }

  auto passwords = source_size(resolve_source(cfg.password, Slot::Password, ctx), lines, err_out);
  if (!passwords) return std::nullopt;
  if (cfg.password_only) return passwords;

  auto users = source_size(resolve_source(cfg.user, Slot::User, ctx), lines, err_out);
  if (!users) return std::nullopt;
  return *users * *passwords;
}

}
