#include "chunk_window/app_config.hpp"
#include "chunk_window/byte_size.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int fails = 0;
static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static bool parse(std::vector<std::string> args, cw::AppConfig& cfg, std::string* err) {
  std::vector<char*> argv;
  static char prog[] = "chunk-window";
  argv.push_back(prog);
  for (auto& a : args) argv.push_back(a.data());
  return cw::parse_args(static_cast<int>(argv.size()), argv.data(), cfg, err);
}

int main(){
  // byte sizes
  check(cw::parse_byte_size("1048576") == 1048576u, "plain bytes");
  check(cw::parse_byte_size("64KiB") == 65536u, "KiB");
  check(cw::parse_byte_size("64k") == 65536u, "k");
  check(cw::parse_byte_size("1.5MiB") == 1572864u, "fractional MiB");
  check(cw::parse_byte_size("2 GB") == 2147483648u, "GB with space");
  check(cw::parse_byte_size(" 10b ") == 10u, "bytes suffix with padding");
  check(!cw::parse_byte_size(""), "empty size");
  check(!cw::parse_byte_size("-4k"), "negative size");
  check(!cw::parse_byte_size("12 parsecs"), "unknown unit");
  check(!cw::parse_byte_size("kb"), "unit without a number");
  check(cw::parse_count("42") == 42u && !cw::parse_count("4.2") && !cw::parse_count("-1"), "counts");

  // flags
  {
    cw::AppConfig cfg;
    std::string err;
    bool ok = parse({"--strategy=sliding-window", "--chunk-size=4KiB", "--max-cached-chunks=8",
                     "--consumers=3", "--stagger-ms=5", "--verbose", "--scan", "a.bin", "--scan=b.bin",
                     "--slug-mode=basename", "--slug-len=20", "--port=9000"}, cfg, &err);
    check(ok, "flags parse: " + err);
    check(cfg.streaming.strategy == cw::StrategyKind::SlidingWindow, "strategy flag");
    check(cfg.streaming.chunk_bytes == 4096 && cfg.streaming.max_cached_chunks == 8, "size flags");
    check(cfg.consumers == 3 && cfg.stagger_ms == 5 && cfg.verbose, "consumer flags");
    check(cfg.scans.size() == 2 && cfg.scans[0] == "a.bin" && cfg.scans[1] == "b.bin", "scan flags");
    check(cfg.slug_mode == "basename" && cfg.slug_len == 20 && cfg.port == 9000, "artifact flags");
    check(cw::validate(cfg, &err), "valid config: " + err);
  }
  {
    cw::AppConfig cfg;
    std::string err;
    check(!parse({"--chunk-size=lots"}, cfg, &err) && err.find("--chunk-size") != std::string::npos,
          "bad size flag names the flag");
    check(!parse({"--frobnicate"}, cfg, &err), "unknown flag rejected");
    check(!parse({"--strategy=repeatable"}, cfg, &err), "unknown strategy rejected");
  }
  {
    cw::AppConfig cfg;
    std::string err;
    check(parse({"--consumers=2"}, cfg, &err), "consumers parse");
    check(!cw::validate(cfg, &err) && err.find("non-repeatable") != std::string::npos,
          "non-repeatable with two consumers is invalid");
    cfg.streaming.strategy = cw::StrategyKind::InMemory;
    check(cw::validate(cfg, &err), "in-memory with two consumers is fine");
    cfg.streaming.chunk_bytes = 0;
    check(!cw::validate(cfg, &err), "chunk size 0 invalid");
    check(parse({"--chunk-size=1000g"}, cfg, &err), "huge chunk size still parses");
    check(!cw::validate(cfg, &err) && err.find("exceeds") != std::string::npos,
          "chunk size above the maximum is invalid");
    check(parse({"--chunk-size=1g"}, cfg, &err) && cw::validate(cfg, &err),
          "chunk size at the maximum is fine");
  }

  // config file, then flags on top
  {
    const fs::path f = fs::temp_directory_path() / "cw_test_config.json";
    {
      std::ofstream out(f);
      out << R"({"strategy": "file-store", "chunk_size": "16KiB", "max_in_memory_chunks": 7,
                 "spill_dir": "/tmp", "consumers": 2, "verbose": true,
                 "artifact_root": "out/runs", "port": 8181})";
    }
    cw::AppConfig cfg;
    std::string err;
    check(cw::load_config_file(f.string(), cfg, &err), "config file loads: " + err);
    check(cfg.streaming.strategy == cw::StrategyKind::FileStore && cfg.streaming.chunk_bytes == 16384 &&
          cfg.streaming.max_in_memory_chunks == 7 && cfg.streaming.spill_dir == "/tmp",
          "streaming values from file");
    check(cfg.consumers == 2 && cfg.verbose && cfg.artifact_root == "out/runs" && cfg.port == 8181,
          "app values from file");

    std::string arg = "--config=" + f.string();
    std::vector<char*> argv;
    static char prog[] = "chunk-window";
    static char port[] = "--port=7000";
    argv.push_back(prog);
    argv.push_back(port);
    argv.push_back(arg.data());
    check(cw::config_path_arg(3, argv.data()) == f.string(), "config path found after other flags");
    check(cw::parse_args(3, argv.data(), cfg, &err) && cfg.port == 7000, "flag overrides file");

    { std::ofstream out(f); out << R"({"chunk_size": 1024, "colour": "blue"})"; }
    check(!cw::load_config_file(f.string(), cfg, &err) && err.find("colour") != std::string::npos,
          "unknown key rejected");
    { std::ofstream out(f); out << "{not json"; }
    check(!cw::load_config_file(f.string(), cfg, &err), "malformed file rejected");
    fs::remove(f);
    check(!cw::load_config_file(f.string(), cfg, &err), "missing file rejected");
  }

  if (fails) return 1;
  std::cout << "[PASS] app config\n";
  return 0;
}
