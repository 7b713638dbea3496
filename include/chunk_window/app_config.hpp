#pragma once
#include "chunk_window/streaming_strategy.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cw {

struct AppConfig {
  StreamingConfig streaming;

  int consumers = 1;
  std::uint64_t stagger_ms = 0;   // consumer i sleeps i * stagger_ms per chunk
  bool verbose = false;

  std::string artifact_root = "artifacts/chunk-window";
  std::string slug_mode = "hashprefix";   // hashprefix|basename|keypath
  int slug_len = 8;

  int port = 8080;
  bool serve_only = false;
  bool show_help = false;

  std::vector<std::string> scans;
};

// JSON object with the long flag names in snake_case, e.g.
//   {"strategy": "sliding-window", "chunk_size": "64KiB", "consumers": 3}
// Unknown keys are rejected. Fields already present in cfg are overwritten.
bool load_config_file(const std::string& path, AppConfig& cfg, std::string* err_out = nullptr);

// Value of the last --config=FILE, or empty.
std::string config_path_arg(int argc, char** argv);

// Every flag except --config=, applied on top of cfg. Load the config file
// first so flags win regardless of their order.
bool parse_args(int argc, char** argv, AppConfig& cfg, std::string* err_out = nullptr);

// Cross-field checks, including StreamingConfig::validate().
bool validate(const AppConfig& cfg, std::string* err_out = nullptr);

const char* usage_text() noexcept;

}
