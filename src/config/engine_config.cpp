#include "credstream/engine_config.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <fast_float/fast_float.h>
#include <simdjson.h>

namespace cs {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static std::optional<double> suffix_multiplier(std::string_view sfx) {
  while (!sfx.empty() && sfx.front() == ' ') sfx.remove_prefix(1);
  if (sfx.empty() || ieq(sfx, "b")) return 1.0;
  static constexpr std::string_view units[] = {"k", "m", "g", "t"};
  double mult = 1024.0;
  for (auto u : units) {
    if (ieq(sfx, u) || ieq(sfx, std::string(u) + "b") || ieq(sfx, std::string(u) + "ib")) return mult;
    mult *= 1024.0;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_size(std::string_view s) {
  if (s.empty()) return std::nullopt;
  double v;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || !std::isfinite(v) || v < 0.0) return std::nullopt;

  auto mult = suffix_multiplier(std::string_view(ptr, static_cast<size_t>(s.data() + s.size() - ptr)));
  if (!mult) return std::nullopt;

  const double bytes = std::floor(v * *mult);
  if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) return std::nullopt;
  return static_cast<std::uint64_t>(bytes);
}

static std::uint64_t size_value(simdjson::ondemand::value v, std::string_view key) {
  simdjson::ondemand::json_type t = v.type();
  if (t == simdjson::ondemand::json_type::number) return v.get_uint64();
  std::string_view s = v.get_string();
  auto n = parse_size(s);
  if (!n) throw std::runtime_error("bad size for \"" + std::string(key) + "\": " + std::string(s));
  return *n;
}

static void apply_chunking(simdjson::ondemand::object obj, ChunkedFile::Config& c) {
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    simdjson::ondemand::value v = field.value();
    if (key == "enabled")                   c.disable_chunking = !bool(v.get_bool());
    else if (key == "large_file_threshold") c.large_file_threshold = size_value(v, key);
    else if (key == "chunk_size")           c.chunk_bytes = size_value(v, key);
    else if (key == "temp_root")            c.temp_root = std::string(std::string_view(v.get_string()));
  }
  if (c.chunk_bytes == 0) throw std::runtime_error("chunk_size must be positive");
}

static void apply_lines(simdjson::ondemand::object obj, LineReader::Config& c) {
  for (auto field : obj) {
    std::string_view key = field.unescaped_key();
    simdjson::ondemand::value v = field.value();
    if (key == "buffer_size")          c.buffer_bytes = static_cast<std::size_t>(size_value(v, key));
    else if (key == "max_line_length") c.max_line_bytes = static_cast<std::size_t>(size_value(v, key));
    else if (key == "strip_cr")        c.strip_cr = bool(v.get_bool());
  }
  if (c.buffer_bytes == 0) throw std::runtime_error("buffer_size must be positive");
}

static bool parse_padded(simdjson::padded_string& json, EngineConfig& out, std::string* err_out) {
  thread_local simdjson::ondemand::parser parser;
  EngineConfig next = out;  // commit only on success
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object root = doc.get_object();
    for (auto field : root) {
      std::string_view key = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      if (key == "chunking")                apply_chunking(v.get_object(), next.chunking);
      else if (key == "lines")              apply_lines(v.get_object(), next.chunking.reader);
      else if (key == "use_empty_password") next.use_empty_password = bool(v.get_bool());
      else if (key == "wordlists")          next.wordlists_path = std::string(std::string_view(v.get_string()));
    }
  } catch (const std::exception& e) {
    if (err_out) *err_out = std::string("config: ") + e.what();
    return false;
  }
  out = std::move(next);
  return true;
}

bool load_engine_config(const std::string& path, EngineConfig& out, std::string* err_out) {
  simdjson::padded_string json;
  auto err = simdjson::padded_string::load(path).get(json);
  if (err) {
    if (err_out) *err_out = "failed to load " + path + ": " + simdjson::error_message(err);
    return false;
  }
  return parse_padded(json, out, err_out);
}

bool parse_engine_config(std::string_view json, EngineConfig& out, std::string* err_out) {
  simdjson::padded_string padded(json);
  return parse_padded(padded, out, err_out);
}

}
