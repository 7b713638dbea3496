#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cw {

struct RunJsonConsumer {
  std::string label;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  std::string sha256;
  bool ok = true;
  std::string error;   // empty when ok
};

struct RunJsonWindow {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t fetched = 0;
  std::uint64_t evicted = 0;
  std::uint64_t high_water = 0;
  std::uint64_t overflows = 0;
  std::uint64_t cached_at_end = 0;
};

struct RunJsonError {
  std::string kind;
  std::string message;
};

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t bytes = 0;
  std::uint64_t chunks = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double chunks_per_sec = 0.0;

  // Streaming setup
  std::string strategy;
  std::uint64_t chunk_bytes = 0;
  std::uint64_t max_cached_chunks = 0;

  std::vector<RunJsonConsumer> consumers;
  RunJsonWindow window;   // zeros unless sliding-window

  // Stages and errors
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
  std::optional<RunJsonError> error;

  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);
};

}
