#include "chunk_window/app_config.hpp"
#include "chunk_window/artifact_writer.hpp"
#include "chunk_window/byte_source.hpp"
#include "chunk_window/digest.hpp"
#include "chunk_window/errors.hpp"
#include "chunk_window/http_server.hpp"
#include "chunk_window/metrics.hpp"
#include "chunk_window/path_utils.hpp"
#include "chunk_window/run_json.hpp"
#include "chunk_window/streaming_strategy.hpp"
#include "chunk_window/window_cache.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

struct ConsumerResult {
  std::string label;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  std::string sha256;
  bool ok = true;
  std::string error_kind;
  std::string error;
};

void fail(ConsumerResult& r, std::string kind, std::string msg) {
  r.ok = false;
  r.error_kind = std::move(kind);
  r.error = std::move(msg);
}

// Drains one cursor, checking that chunks arrive in order with sane flags.
void consume(cw::Cursor& cur, std::uint64_t delay_ms, ConsumerResult& r) {
  bool saw_last = false;
  try {
    cw::Sha256 h;
    while (cur.has_next()) {
      auto c = cur.next();
      if (saw_last) {
        fail(r, "CONTINUITY", "chunk " + std::to_string(c->index()) + " after the last chunk");
        break;
      }
      if (c->index() != r.chunks || c->offset() != r.bytes || c->is_first() != (r.chunks == 0)) {
        fail(r, "CONTINUITY", "expected chunk " + std::to_string(r.chunks) + " at offset " +
                              std::to_string(r.bytes) + ", got " + c->to_string());
        break;
      }
      h.update(c->data(), c->length());
      ++r.chunks;
      r.bytes += c->length();
      saw_last = c->is_last();
      if (delay_ms) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    if (r.ok && r.chunks > 0 && !saw_last)
      fail(r, "CONTINUITY", "stream ended without a last chunk");
    r.sha256 = h.hex();
  } catch (const cw::ChunkWindowError& e) {
    fail(r, std::string(cw::to_string(e.kind())), e.what());
  } catch (const std::exception& e) {
    fail(r, "INTERNAL", e.what());
  }
  cur.release();
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // hashprefix hashes the absolute path so re-runs land in the same directory
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return cw::make_slug(key, mode, len);
}

int scan_one_file(const std::string& filepath, const cw::AppConfig& cfg) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  cw::MetricsRegistry metrics;
  cw::RunJsonPayload p{};
  p.filename = filepath;
  p.strategy = cw::to_string(cfg.streaming.strategy);
  p.chunk_bytes = cfg.streaming.chunk_bytes;
  if (cfg.streaming.strategy == cw::StrategyKind::SlidingWindow)
    p.max_cached_chunks = cfg.streaming.max_cached_chunks;
  std::error_code fec;
  auto fsize = std::filesystem::file_size(filepath, fec);
  if (!fec) p.file_size = fsize;

  std::vector<ConsumerResult> results(static_cast<std::size_t>(cfg.consumers));
  for (std::size_t i = 0; i < results.size(); ++i) results[i].label = "consumer-" + std::to_string(i);

  int rc = 0;
  metrics.start_stage("open");
  std::unique_ptr<cw::CursorProvider> provider;
  std::vector<std::unique_ptr<cw::Cursor>> cursors;
  try {
    provider = cw::open_chunked(std::make_unique<cw::FileByteSource>(filepath), cfg.streaming);
    for (auto& r : results) {
      cw::CursorOptions opts;
      opts.label = r.label;
      cursors.push_back(provider->open_cursor(opts));
    }
  } catch (const cw::ChunkWindowError& e) {
    p.error = cw::RunJsonError{std::string(cw::to_string(e.kind())), e.what()};
    metrics.add_error(cw::to_string(e.kind()));
    cursors.clear();
    rc = 3;
  } catch (const std::exception& e) {
    p.error = cw::RunJsonError{"INTERNAL", e.what()};
    metrics.add_error("INTERNAL");
    cursors.clear();
    rc = 3;
  }
  metrics.end_stage("open");

  if (rc == 0) {
    metrics.start_stage("consume");
    std::vector<std::thread> threads;
    threads.reserve(cursors.size());
    for (std::size_t i = 0; i < cursors.size(); ++i) {
      const std::uint64_t delay = i * cfg.stagger_ms;
      threads.emplace_back([&, i, delay] { consume(*cursors[i], delay, results[i]); });
    }
    for (auto& t : threads) t.join();
    metrics.end_stage("consume");

    if (auto* window = dynamic_cast<cw::SlidingWindowCache*>(provider.get())) {
      const auto st = window->stats();
      p.window = cw::RunJsonWindow{st.hits, st.misses, st.fetched, st.evicted,
                                   st.high_water, st.overflows, window->cached_chunks()};
    }
    cursors.clear();
    provider->close();

    std::uint64_t chunks = 0, bytes = 0;
    for (const auto& r : results) {
      chunks = std::max(chunks, r.chunks);
      bytes = std::max(bytes, r.bytes);
      if (cfg.verbose) {
        std::cout << "[consumer] " << r.label << ": " << r.chunks << " chunks, " << r.bytes
                  << " bytes, sha256 " << r.sha256 << (r.ok ? "" : " (" + r.error + ")") << "\n";
      }
      if (!r.ok) {
        metrics.add_error(r.error_kind);
        if (!p.error) p.error = cw::RunJsonError{r.error_kind, r.label + ": " + r.error};
      }
    }
    // every consumer that finished must have seen the same bytes
    for (const auto& r : results) {
      if (r.ok && results.front().ok && r.sha256 != results.front().sha256) {
        metrics.add_error("DIGEST_MISMATCH");
        if (!p.error) p.error = cw::RunJsonError{"DIGEST_MISMATCH", r.label + " disagrees with " +
                                                 results.front().label};
      }
    }
    metrics.add_chunks(chunks);
    metrics.add_bytes(bytes);
    if (p.error) rc = 3;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const auto stats = metrics.snapshot(wall_ms);
  p.bytes = stats.bytes;
  p.chunks = stats.chunks;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = stats.throughput_mb_s;
  p.chunks_per_sec = stats.chunks_per_sec;
  for (const auto& st : stats.stages) p.stage_times.emplace_back(st.name, st.duration_ms);
  p.errors_by_kind = stats.errors_by_kind;
  for (const auto& r : results) {
    p.consumers.push_back(cw::RunJsonConsumer{r.label, r.chunks, r.bytes, r.sha256, r.ok, r.error});
  }

  const std::string slug = make_slug_for(filepath, cfg.slug_mode, cfg.slug_len);
  std::string err;
  if (!cw::write_report_dir(cfg.artifact_root, slug, p, &err)) {
    std::cerr << "[scan] write_report_dir failed: " << err << "\n";
    return rc ? rc : 2;
  }

  if (rc == 0) {
    std::cout << "[scan] ok: " << filepath << " -> " << cfg.artifact_root << "/" << slug
              << "/report.html (" << p.chunks << " chunks, " << p.bytes << " bytes)\n";
  } else {
    std::cerr << "[scan] error: " << filepath << ": " << p.error->kind << ": "
              << p.error->message << "\n";
  }
  return rc;
}

}

int main(int argc, char** argv) {
  cw::AppConfig cfg;
  std::string err;
  const auto config_path = cw::config_path_arg(argc, argv);
  if (!config_path.empty() && !cw::load_config_file(config_path, cfg, &err)) {
    std::cerr << "[config] error: " << err << "\n";
    return 2;
  }
  if (!cw::parse_args(argc, argv, cfg, &err)) {
    std::cerr << "[config] error: " << err << "\n" << cw::usage_text();
    return 1;
  }
  if (cfg.show_help) {
    std::cout << cw::usage_text();
    return 0;
  }
  if (!cw::validate(cfg, &err)) {
    std::cerr << "[config] error: " << err << "\n" << cw::usage_text();
    return 1;
  }

  if (!cfg.serve_only && !cfg.scans.empty()) {
    int rc = 0;
    for (const auto& f : cfg.scans) rc = std::max(rc, scan_one_file(f, cfg));
    return rc;
  }

  cw::HttpServer::Config scfg;
  scfg.port = cfg.port;
  scfg.artifact_root = cfg.artifact_root;

  cw::HttpServer server(scfg);
  if (!server.start()) {
    std::cerr << "[serve] " << server.last_error() << "\n";
    return 2;
  }
  std::cout << "[serve] http://localhost:" << server.port() << "/ (" << cfg.artifact_root << ")\n";
  if (!server.listen()) {
    std::cerr << "[serve] " << server.last_error() << "\n";
    return 2;
  }
  return 0;
}
