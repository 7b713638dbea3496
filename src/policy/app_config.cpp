#include "chunk_window/app_config.hpp"
#include "chunk_window/byte_size.hpp"
#include "chunk_window/errors.hpp"
#include <simdjson.h>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace cw {

namespace {

void set_err(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
}

bool as_int(std::uint64_t v, int& out) {
  if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
  out = static_cast<int>(v);
  return true;
}

// number, or a string with an optional unit suffix
std::optional<std::uint64_t> json_size(simdjson::ondemand::value v) {
  simdjson::ondemand::json_type t = v.type();
  if (t == simdjson::ondemand::json_type::number) {
    std::uint64_t n = v.get_uint64();
    return n;
  }
  std::string_view s = v.get_string();
  return parse_byte_size(s);
}

std::optional<std::uint64_t> json_count(simdjson::ondemand::value v) {
  simdjson::ondemand::json_type t = v.type();
  if (t == simdjson::ondemand::json_type::number) {
    std::uint64_t n = v.get_uint64();
    return n;
  }
  std::string_view s = v.get_string();
  return parse_count(s);
}

}

bool load_config_file(const std::string& path, AppConfig& cfg, std::string* err_out) {
  try {
    simdjson::padded_string json = simdjson::padded_string::load(path);
    simdjson::ondemand::parser parser;
    simdjson::ondemand::document doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();

    for (auto field : obj) {
      std::string_view key = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      const std::string k(key);

      auto bad = [&](const char* what) {
        set_err(err_out, path + ": " + k + ": " + what);
        return false;
      };

      if (k == "strategy") {
        std::string_view s = v.get_string();
        auto kind = parse_strategy(s);
        if (!kind) return bad("unknown strategy");
        cfg.streaming.strategy = *kind;
      } else if (k == "chunk_size") {
        auto n = json_size(v);
        if (!n) return bad("not a byte size");
        cfg.streaming.chunk_bytes = static_cast<std::size_t>(*n);
      } else if (k == "max_cached_chunks") {
        auto n = json_count(v);
        if (!n) return bad("not a count");
        cfg.streaming.max_cached_chunks = static_cast<std::size_t>(*n);
      } else if (k == "max_buffered_chunks") {
        auto n = json_count(v);
        if (!n) return bad("not a count");
        cfg.streaming.max_buffered_chunks = static_cast<std::size_t>(*n);
      } else if (k == "max_in_memory_chunks") {
        auto n = json_count(v);
        if (!n) return bad("not a count");
        cfg.streaming.max_in_memory_chunks = static_cast<std::size_t>(*n);
      } else if (k == "spill_dir") {
        std::string_view s = v.get_string();
        cfg.streaming.spill_dir = std::string(s);
      } else if (k == "consumers") {
        auto n = json_count(v);
        if (!n || !as_int(*n, cfg.consumers)) return bad("not a count");
      } else if (k == "stagger_ms") {
        auto n = json_count(v);
        if (!n) return bad("not a count");
        cfg.stagger_ms = *n;
      } else if (k == "verbose") {
        cfg.verbose = v.get_bool();
      } else if (k == "artifact_root") {
        std::string_view s = v.get_string();
        cfg.artifact_root = std::string(s);
      } else if (k == "slug_mode") {
        std::string_view s = v.get_string();
        cfg.slug_mode = std::string(s);
      } else if (k == "slug_len") {
        auto n = json_count(v);
        if (!n || !as_int(*n, cfg.slug_len)) return bad("not a count");
      } else if (k == "port") {
        auto n = json_count(v);
        if (!n || !as_int(*n, cfg.port)) return bad("not a port");
      } else if (k == "serve_only") {
        cfg.serve_only = v.get_bool();
      } else {
        return bad("unknown key");
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    set_err(err_out, path + ": " + e.what());
    return false;
  }
  return true;
}

std::string config_path_arg(int argc, char** argv) {
  std::string out;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) out = a.substr(9);
  }
  return out;
}

bool parse_args(int argc, char** argv, AppConfig& cfg, std::string* err_out) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    std::string val;
    auto eat = [&](const char* pfx){
      if (a.rfind(pfx, 0) == 0) { val = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto bad = [&](const char* flag) {
      set_err(err_out, std::string("invalid value for ") + flag + ": '" + val + "'");
      return false;
    };
    auto count_into = [&](auto& out) {
      auto n = parse_count(val);
      if (!n) return false;
      out = static_cast<std::remove_reference_t<decltype(out)>>(*n);
      return true;
    };
    auto int_into = [&](int& out) {
      auto n = parse_count(val);
      return n && as_int(*n, out);
    };

    if (eat("--config=")) continue;
    if (eat("--strategy=")) {
      auto kind = parse_strategy(val);
      if (!kind) return bad("--strategy");
      cfg.streaming.strategy = *kind;
      continue;
    }
    if (eat("--chunk-size=")) {
      auto n = parse_byte_size(val);
      if (!n) return bad("--chunk-size");
      cfg.streaming.chunk_bytes = static_cast<std::size_t>(*n);
      continue;
    }
    if (eat("--max-cached-chunks=")) {
      if (!count_into(cfg.streaming.max_cached_chunks)) return bad("--max-cached-chunks");
      continue;
    }
    if (eat("--max-buffered-chunks=")) {
      if (!count_into(cfg.streaming.max_buffered_chunks)) return bad("--max-buffered-chunks");
      continue;
    }
    if (eat("--max-in-memory-chunks=")) {
      if (!count_into(cfg.streaming.max_in_memory_chunks)) return bad("--max-in-memory-chunks");
      continue;
    }
    if (eat("--spill-dir=")) { cfg.streaming.spill_dir = val; continue; }
    if (eat("--consumers=")) {
      if (!int_into(cfg.consumers)) return bad("--consumers");
      continue;
    }
    if (eat("--stagger-ms=")) {
      if (!count_into(cfg.stagger_ms)) return bad("--stagger-ms");
      continue;
    }
    if (eat("--artifact-root=")) { cfg.artifact_root = val; continue; }
    if (eat("--slug-mode="))     { cfg.slug_mode = val; continue; }
    if (eat("--slug-len=")) {
      if (!int_into(cfg.slug_len)) return bad("--slug-len");
      continue;
    }
    if (eat("--port=")) {
      if (!int_into(cfg.port)) return bad("--port");
      continue;
    }
    if (a == "--verbose")    { cfg.verbose = true; continue; }
    if (a == "--serve-only") { cfg.serve_only = true; continue; }
    if (a == "--scan") {
      if (i + 1 >= argc) { set_err(err_out, "--scan needs a file"); return false; }
      cfg.scans.push_back(argv[++i]);
      continue;
    }
    if (eat("--scan=")) { cfg.scans.push_back(val); continue; }
    if (a == "-h" || a == "--help") { cfg.show_help = true; continue; }

    set_err(err_out, "unknown argument: " + a);
    return false;
  }
  return true;
}

bool validate(const AppConfig& cfg, std::string* err_out) {
  try {
    cfg.streaming.validate();
  } catch (const ConfigError& e) {
    set_err(err_out, e.what());
    return false;
  }
  if (cfg.consumers < 1) {
    set_err(err_out, "consumers must be at least 1");
    return false;
  }
  if (cfg.streaming.strategy == StrategyKind::NonRepeatable && cfg.consumers > 1) {
    set_err(err_out, "non-repeatable strategy supports exactly one consumer, got " +
                     std::to_string(cfg.consumers));
    return false;
  }
  if (cfg.slug_mode != "hashprefix" && cfg.slug_mode != "basename" && cfg.slug_mode != "keypath") {
    set_err(err_out, "unknown slug mode: " + cfg.slug_mode);
    return false;
  }
  if (cfg.slug_len < 1) {
    set_err(err_out, "slug length must be positive");
    return false;
  }
  if (cfg.port < 0 || cfg.port > 65535) {
    set_err(err_out, "port out of range: " + std::to_string(cfg.port));
    return false;
  }
  return true;
}

const char* usage_text() noexcept {
  return
    "Usage: chunk-window [--config=FILE] [--strategy=NAME] [--chunk-size=SIZE]\n"
    "                    [--max-cached-chunks=N] [--max-buffered-chunks=N] [--max-in-memory-chunks=N]\n"
    "                    [--spill-dir=DIR] [--consumers=N] [--stagger-ms=N] [--verbose]\n"
    "                    [--artifact-root=DIR] [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                    [--scan <file>|--scan=<file>] [--port=N] [--serve-only]\n"
    "Strategies: non-repeatable (default), in-memory, file-store, sliding-window\n";
}

}
