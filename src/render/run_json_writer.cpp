#include "chunk_window/run_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite
#include <cstdio>

namespace cw {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"chunks\":" << p.chunks << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"chunks_per_sec\":" << safe_num(p.chunks_per_sec) << ",";
  o << "\"strategy\":"; esc(o, p.strategy); o << ",";
  o << "\"chunk_bytes\":" << p.chunk_bytes << ",";
  o << "\"max_cached_chunks\":" << p.max_cached_chunks << ",";

  o << "\"consumers\":[";
  for (size_t i=0;i<p.consumers.size();++i){
    if (i) o << ",";
    const auto& c = p.consumers[i];
    o << "{\"label\":"; esc(o, c.label);
    o << ",\"chunks\":" << c.chunks;
    o << ",\"bytes\":" << c.bytes;
    o << ",\"sha256\":"; esc(o, c.sha256);
    o << ",\"ok\":" << (c.ok ? "true" : "false");
    o << ",\"error\":"; esc(o, c.error);
    o << "}";
  }
  o << "],";

  const auto& w = p.window;
  o << "\"window\":{"
    << "\"hits\":"          << w.hits       << ","
    << "\"misses\":"        << w.misses     << ","
    << "\"fetched\":"       << w.fetched    << ","
    << "\"evicted\":"       << w.evicted    << ","
    << "\"high_water\":"    << w.high_water << ","
    << "\"overflows\":"     << w.overflows  << ","
    << "\"cached_at_end\":" << w.cached_at_end
    << "},";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : p.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"error\":";
  if (p.error) {
    o << "{\"kind\":"; esc(o, p.error->kind);
    o << ",\"message\":"; esc(o, p.error->message); o << "}";
  } else {
    o << "null";
  }
  o << ",";

  o << "\"filename\":";     esc(o, p.filename);     o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
