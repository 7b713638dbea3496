#include "chunk_window/artifact_writer.hpp"
#include "chunk_window/mustache_renderer.hpp"
#include "chunk_window/path_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace cw {

static std::string fixed2(double v) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(2) << v;
  return o.str();
}

TemplateContext make_report_context(const RunJsonPayload& p, const std::string& run_json) {
  TemplateContext ctx;
  ctx.set("filename", p.filename);
  ctx.set("file_size", std::to_string(p.file_size));
  ctx.set("strategy", p.strategy);
  ctx.set("chunk_bytes", std::to_string(p.chunk_bytes));
  ctx.set("max_cached_chunks", std::to_string(p.max_cached_chunks));
  ctx.set("bytes", std::to_string(p.bytes));
  ctx.set("chunks", std::to_string(p.chunks));
  ctx.set("wall_time_ms", fixed2(p.wall_time_ms));
  ctx.set("throughput_mb_s", fixed2(p.throughput_mb_s));
  ctx.set("chunks_per_sec", fixed2(p.chunks_per_sec));
  ctx.set("run_json", run_json);

  const auto& w = p.window;
  ctx.set("window_hits", std::to_string(w.hits));
  ctx.set("window_misses", std::to_string(w.misses));
  ctx.set("window_fetched", std::to_string(w.fetched));
  ctx.set("window_evicted", std::to_string(w.evicted));
  ctx.set("window_high_water", std::to_string(w.high_water));
  ctx.set("window_overflows", std::to_string(w.overflows));
  ctx.set("window_cached_at_end", std::to_string(w.cached_at_end));
  ctx.flags["has_window"] = p.strategy == "sliding-window";

  auto& consumers = ctx.lists["consumers"];
  for (const auto& c : p.consumers) {
    consumers.push_back({{"label", c.label},
                         {"chunks", std::to_string(c.chunks)},
                         {"bytes", std::to_string(c.bytes)},
                         {"sha256", c.sha256},
                         {"status", c.ok ? "ok" : "failed"},
                         {"error", c.error}});
  }

  auto& stages = ctx.lists["stages"];
  for (const auto& st : p.stage_times)
    stages.push_back({{"stage", st.first}, {"duration_ms", std::to_string(st.second)}});

  ctx.flags["has_error"] = p.error.has_value();
  if (p.error) {
    ctx.set("error_kind", p.error->kind);
    ctx.set("error_message", p.error->message);
  }
  return ctx;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;
  const std::string run_json = RunJsonWriter::to_json(payload);

  // (A) run.json next to report.html
  {
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
      if (err_out) *err_out = "cannot create " + out_dir.string() + ": " + ec.message();
      return false;
    }
    std::ofstream rj(out_dir / "run.json", std::ios::binary);
    if (!rj) {
      if (err_out) *err_out = "failed to write run.json";
      return false;
    }
    rj.write(run_json.data(), static_cast<std::streamsize>(run_json.size()));
  }

  // (B) report.html + stylesheet
  MustacheRenderer::Config rcfg;
#ifdef CW_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = CW_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";
  rcfg.static_css   = {"web/css/report.css"};

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_dir("report.mustache",
                                         make_report_context(payload, run_json),
                                         out_dir.string(),
                                         "report.html",
                                         /*copy_assets=*/true);
  if (!ok && err_out) *err_out = renderer.last_error();
  return ok;
}

}
