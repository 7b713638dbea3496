#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cw {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double chunks_per_sec = 0.0;

  std::vector<StageTiming> stages;   // in first-start order
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

// Single-threaded run bookkeeping; consumers report into it after they join.
class MetricsRegistry {
public:
  void reset();
  void add_chunks(std::uint64_t n) noexcept { chunks_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_error(std::string_view kind);
  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> kind_errs_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
