#include "chunk_window/artifact_writer.hpp"
#include "chunk_window/http_server.hpp"
#include "chunk_window/run_json.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include "httplib.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

int main() {
  const fs::path art = fs::temp_directory_path() / ("cw-http-" + std::to_string(std::time(nullptr)));
  fs::create_directories(art);

  // one finished run to list
  cw::RunJsonPayload p;
  p.filename = "sample.bin";
  p.strategy = "in-memory";
  p.bytes = 1234;
  p.chunks = 2;
  p.consumers.push_back(cw::RunJsonConsumer{"consumer-0", 2, 1234, std::string(64, 'a'), true, ""});
  std::string err;
  if (!cw::write_report_dir(art.string(), "sample", p, &err)) {
    std::cerr << "[ERR] could not write fixture report: " << err << "\n";
    return 2;
  }

  cw::HttpServer::Config cfg;
  cfg.artifact_root = art.string();
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cw::HttpServer server(cfg);
  if (!server.start()) { std::cerr << "[FAIL] bind: " << server.last_error() << "\n"; return 1; }
  std::thread th([&]{ server.listen(); });

  httplib::Client cli("127.0.0.1", server.port());
  bool ok = true;

  std::string index;
  for (int i = 0; i < 50; i++) {
    if (auto res = cli.Get("/")) {
      if (res->status == 200) { index = res->body; break; }
    }
    std::this_thread::sleep_for(100ms);
  }
  if (index.find("/reports/sample/report.html") == std::string::npos ||
      index.find("in-memory") == std::string::npos ||
      index.find("1234 bytes") == std::string::npos) {
    std::cerr << "[FAIL] index does not list the run: " << index << "\n";
    ok = false;
  }

  auto report = cli.Get("/reports/sample/report.html");
  if (!report || report->status != 200 || report->body.find("sample.bin") == std::string::npos) {
    std::cerr << "[FAIL] report.html not served\n";
    ok = false;
  }
  auto run = cli.Get("/reports/sample/run.json");
  if (!run || run->status != 200 || run->get_header_value("Content-Type").find("json") == std::string::npos) {
    std::cerr << "[FAIL] run.json not served as json\n";
    ok = false;
  }
  auto missing = cli.Get("/reports/sample/nope.txt");
  if (!missing || missing->status != 404) { std::cerr << "[FAIL] missing file should 404\n"; ok = false; }
  auto escape = cli.Get("/reports/sample/..%2F..%2Fetc%2Fpasswd");
  if (!escape || (escape->status != 400 && escape->status != 403 && escape->status != 404)) {
    std::cerr << "[FAIL] traversal not refused\n";
    ok = false;
  }

  server.stop();
  th.join();
  std::error_code ec;
  fs::remove_all(art, ec);

  if (!ok) return 1;
  std::cout << "[PASS] http server serves index and reports\n";
  return 0;
}
