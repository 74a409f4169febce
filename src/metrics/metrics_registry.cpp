#include "credstream/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cs {

void MetricsRegistry::reset() {
  emitted_ = skipped_ = bytes_ = chunk_files_ = expected_ = 0;
  source_errs_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_source_error(std::string_view source) {
  ++source_errs_[std::string(source)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.emitted = emitted_;
  r.skipped_lines = skipped_;
  r.bytes = bytes_;
  r.chunk_files = chunk_files_;
  r.expected = expected_;
  r.pairs_per_sec = (wall_ms > 0.0) ? emitted_ / (wall_ms / 1000.0) : 0.0;

  r.errors_by_source = source_errs_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b){ return a.name < b.name; });
  return r;
}

}
