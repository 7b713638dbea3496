#pragma once
#include <string>

namespace cw {

// Serves an artifact root over cpp-httplib:
//   /                          index of runs (read from each run.json)
//   /reports/<slug>/<file>     report.html, report.css, run.json
class HttpServer {
public:
  struct Config {
    std::string artifact_root = "artifacts/chunk-window";
    std::string index_title   = "Chunk Window Runs";
    std::string host = "0.0.0.0";
    int port = 8080;   // 0 picks a free port
  };

  explicit HttpServer(Config cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind only; returns false on bind error (see last_error()).
  bool start();

  // Blocking serve after start(); returns false if the listener failed.
  bool listen();

  // start() + listen(); returns when the server stops.
  int run();

  void stop();

  // The bound port, valid after start().
  int port() const noexcept;

  const std::string& last_error() const noexcept;

private:
  struct Impl;
  Impl* p_;
};

}
