#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cs {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t emitted = 0;        // pairs handed to the caller
  std::uint64_t skipped_lines = 0;  // malformed combo lines
  std::uint64_t bytes = 0;          // bytes pulled from wordlist files
  std::uint64_t chunk_files = 0;    // chunk files created for large inputs
  std::uint64_t expected = 0;       // result of the counting pass, if run
  double pairs_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_source;
};

// Not thread-safe; one registry per iterator or counting pass.
class MetricsRegistry {
public:
  void reset();
  void add_emitted() noexcept { ++emitted_; }
  void add_skipped() noexcept { ++skipped_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_chunk_files(std::uint64_t n) noexcept { chunk_files_ += n; }
  void set_expected(std::uint64_t n) noexcept { expected_ = n; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  // "user", "password" or "combo"
  void add_source_error(std::string_view source);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t emitted_{0};
  std::uint64_t skipped_{0};
  std::uint64_t bytes_{0};
  std::uint64_t chunk_files_{0};
  std::uint64_t expected_{0};
  std::unordered_map<std::string, std::uint64_t> source_errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
