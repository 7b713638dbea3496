#include "chunk_window/mustache_renderer.hpp"
#include "chunk_window/path_utils.hpp"

#include <kainjow/mustache.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cw {

namespace mst = kainjow::mustache;

MustacheRenderer::MustacheRenderer() : cfg_{} {}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool read_file(const std::filesystem::path& path, std::string& out, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err += "open failed: " + path.string() + "\n"; return false; }
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

// register each partials_dir/*.mustache under its stem
static void add_partials(mst::data& data, const std::filesystem::path& dir, std::string& err) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) return;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".mustache") continue;
    std::string body;
    if (!read_file(entry.path(), body, err)) continue;
    data.set(entry.path().stem().string(), mst::partial{[body]() { return body; }});
  }
  if (ec) err += "cannot list partials: " + dir.string() + " (" + ec.message() + ")\n";
}

static mst::data to_data(const TemplateContext& ctx) {
  mst::data data;
  for (const auto& kv : ctx.scalars) data.set(kv.first, kv.second);
  for (const auto& kv : ctx.flags) data.set(kv.first, kv.second ? mst::data::type::bool_true
                                                                  : mst::data::type::bool_false);
  for (const auto& kv : ctx.lists) {
    mst::data rows{mst::data::type::list};
    for (const auto& row : kv.second) {
      mst::data item;
      for (const auto& cell : row) item.set(cell.first, cell.second);
      rows.push_back(item);
    }
    data.set(kv.first, rows);
  }
  return data;
}

// --- copy one asset if it exists (tries a couple locations) ---------------
static bool copy_one_asset(const std::filesystem::path& src_hint,
                           const std::filesystem::path& out_dir,
                           std::string& err) {
  std::error_code ec;
  std::vector<std::filesystem::path> candidates;
  candidates.emplace_back(src_hint); // as-is

#ifdef CW_DEFAULT_STATIC_DIR
  {
    std::filesystem::path base(CW_DEFAULT_STATIC_DIR);
    candidates.emplace_back(base / src_hint.filename()); // flatten
    candidates.emplace_back(base / src_hint);            // preserve subdirs
  }
#endif

  std::filesystem::path src{};
  for (auto& c : candidates) {
    if (std::filesystem::exists(c, ec)) { src = c; break; }
  }
  if (src.empty()) {
    err += "asset not found: " + src_hint.string() + "\n";
    return false;
  }

  auto dst = out_dir / src.filename();
  if (!ensure_parent_dirs(dst)) {
    err += "cannot ensure out_dir: " + out_dir.string() + "\n";
    return false;
  }
  std::filesystem::copy_file(src, dst,
      std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    err += "copy failed: " + src.string() + " -> " + dst.string() + " (" + ec.message() + ")\n";
    return false;
  }
  return true;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const TemplateContext& ctx,
                                      std::string_view out_path) {
  err_.clear();

  std::string tpl;
  const auto tpl_path = std::filesystem::path(cfg_.template_dir) / std::string(template_name);
  if (!read_file(tpl_path, tpl, err_)) return false;

  mst::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  mst::data data = to_data(ctx);
  add_partials(data, std::filesystem::path(cfg_.partials_dir), err_);

  const std::string rendered = view.render(data);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  if (!ensure_parent_dirs(std::filesystem::path(out_path))) { err_ = "mkdir -p failed"; return false; }

  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return static_cast<bool>(out);
}

bool MustacheRenderer::render_to_dir(std::string_view template_name,
                                     const TemplateContext& ctx,
                                     std::string_view out_dir,
                                     std::string_view out_name,
                                     bool copy_assets) {
  const std::filesystem::path outdir{std::string(out_dir)};
  const std::filesystem::path outpath = outdir / std::string(out_name);

  if (!render_to_file(template_name, ctx, outpath.string())) {
    return false; // err_ set
  }
  if (!copy_assets) return true;

  std::vector<std::string> css = cfg_.static_css.empty()
      ? std::vector<std::string>{"web/css/report.css"}
      : cfg_.static_css;
  for (auto& s : css) copy_one_asset(std::filesystem::path(s), outdir, err_);

  return true; // a missing stylesheet is not fatal
}

}
