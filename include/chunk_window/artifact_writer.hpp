#pragma once
#include "chunk_window/mustache_renderer.hpp"
#include "chunk_window/run_json.hpp"
#include <string>

namespace cw {

// Writes
//   <artifact_root>/<slug>/run.json
//   <artifact_root>/<slug>/report.html   (templates/report.mustache)
//   + report.css next to it
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const RunJsonPayload& payload,
                      std::string* err_out = nullptr);

// Template view of one run; run.json itself is exposed as {{{run_json}}}.
TemplateContext make_report_context(const RunJsonPayload& p, const std::string& run_json);

}
