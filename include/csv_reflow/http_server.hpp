#pragma once
#include "csv_reflow/engine_config.hpp"
#include <cstddef>
#include <string>

namespace cr {

// Tiny wrapper around cpp-httplib exposing the reformatter as an upload
// endpoint: POST /process-csv/ (multipart: file, delimiter, encoding).
// The report is streamed back with chunked transfer as it is produced.
class HttpServer {
public:
  struct Config {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::size_t max_upload_bytes = 10 * 1024 * 1024; // 10 MiB
    EngineConfig engine;   // defaults for every request
    bool quiet = false;    // no per-record warnings in the log
  };

  explicit HttpServer(Config cfg);
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  ~HttpServer();

  // Binds without serving; returns false on bind error. port 0 picks a free port.
  bool start();
  int bound_port() const noexcept;

  // Blocking run (binds first if needed); returns when server stops.
  int run();

  // Stop if running.
  void stop();

private:
  struct Impl;
  Impl* p_;
};

}
