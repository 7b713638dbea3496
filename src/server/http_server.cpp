#include "chunk_window/http_server.hpp"
#include <httplib.h>
#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace cw {

static std::string guess_mime(const std::string& name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.c_str() + (m - n),
                                [](char a, char b){ return std::tolower(a)==std::tolower(b); });
  };
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".json")) return "application/json; charset=utf-8";
  if (ends(".txt"))  return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

static std::string html_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default:  out += c; break;
    }
  }
  return out;
}

struct RunSummary {
  std::string slug;
  std::string filename;
  std::string strategy;
  std::uint64_t bytes = 0;
  bool ok = false;
  bool readable = false;
};

// Pull the index columns out of <slug>/run.json; a missing or broken file
// still lists the slug.
static RunSummary summarize(const std::filesystem::path& dir) {
  RunSummary s;
  s.slug = dir.filename().string();

  simdjson::padded_string json;
  if (simdjson::padded_string::load((dir / "run.json").string()).get(json)) return s;

  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (parser.iterate(json).get(doc)) return s;

  std::string_view sv;
  if (!doc["filename"].get_string().get(sv)) s.filename = std::string(sv);
  if (!doc["strategy"].get_string().get(sv)) s.strategy = std::string(sv);
  std::uint64_t u = 0;
  if (!doc["bytes"].get_uint64().get(u)) s.bytes = u;
  simdjson::ondemand::json_type t;
  if (!doc["error"].type().get(t)) s.ok = (t == simdjson::ondemand::json_type::null);
  s.readable = true;
  return s;
}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  int bound_port = -1;
  std::string err;

  explicit Impl(Config c) : cfg(std::move(c)) {}

  std::vector<RunSummary> runs() const {
    std::vector<RunSummary> out;
    std::filesystem::path root(cfg.artifact_root);
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (d.is_directory()) out.push_back(summarize(d.path()));
    }
    std::sort(out.begin(), out.end(),
              [](const RunSummary& a, const RunSummary& b){ return a.slug < b.slug; });
    return out;
  }

  std::string index_html() const {
    const auto title = html_escape(cfg.index_title);
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += title + "</title></head><body><h1>" + title + "</h1><ul>";
    for (auto& r : runs()) {
      html += "<li><a href=\"/reports/" + html_escape(r.slug) + "/report.html\">" +
              html_escape(r.slug) + "</a>";
      if (r.readable) {
        html += " " + html_escape(r.filename) + " [" + html_escape(r.strategy) + ", " +
                std::to_string(r.bytes) + " bytes, " + (r.ok ? "ok" : "failed") + "]";
      }
      html += "</li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Serve a file under artifact_root/<slug>/<rel>, preventing traversal.
  void serve_under_slug(const std::string& slug,
                        const std::string& rel,
                        httplib::Response& res) const {
    if (slug.find("..") != std::string::npos || rel.find("..") != std::string::npos) {
      res.status = 400;
      return;
    }

    std::filesystem::path base = std::filesystem::path(cfg.artifact_root) / slug;
    std::error_code ec;
    auto base_canon = std::filesystem::weakly_canonical(base, ec);
    if (ec) { res.status = 404; return; }

    auto target_canon = std::filesystem::weakly_canonical(base_canon / rel, ec);
    if (ec) { res.status = 404; return; }

    auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(),
                                  target_canon.begin(), target_canon.end());
    if (mismatch.first != base_canon.end()) { res.status = 403; return; }

    std::ifstream in(target_canon, std::ios::binary);
    if (!in) { res.status = 404; return; }

    std::ostringstream ss; ss << in.rdbuf();
    res.set_content(ss.str(), guess_mime(target_canon.filename().string()).c_str());
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get(R"(/reports/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_under_slug(req.matches[1].str(), req.matches[2].str(), res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.host);
  } else {
    p_->bound_port = p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port) ? p_->cfg.port : -1;
  }
  if (p_->bound_port < 0) {
    p_->err = "bind failed on " + p_->cfg.host + ":" + std::to_string(p_->cfg.port);
    return false;
  }
  return true;
}

bool HttpServer::listen() {
  if (!p_->svr.listen_after_bind()) {
    p_->err = "listener stopped with an error";
    return false;
  }
  return true;
}

int HttpServer::run() {
  if (!start()) return -1;
  return listen() ? 0 : -1;
}

void HttpServer::stop() { p_->svr.stop(); }

int HttpServer::port() const noexcept { return p_->bound_port; }

const std::string& HttpServer::last_error() const noexcept { return p_->err; }

}
