#include "chunk_window/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace cw {

void MetricsRegistry::reset() {
  chunks_ = bytes_ = 0;
  kind_errs_.clear();
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
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

void MetricsRegistry::add_error(std::string_view kind) {
  ++kind_errs_[std::string(kind)];
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.chunks = chunks_;
  r.bytes = bytes_;
  const double secs = wall_ms / 1000.0;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / secs : 0.0;
  r.chunks_per_sec  = (wall_ms > 0.0) ? chunks_ / secs : 0.0;

  r.errors_by_kind = kind_errs_;
  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    if (it != stage_accum_ms_.end()) r.stages.push_back(StageTiming{name, it->second});
  }
  return r;
}

}
