#include "csv_reflow/http_server.hpp"
#include "csv_reflow/path_utils.hpp"
#include "csv_reflow/reflow_stream.hpp"
#include "csv_reflow/run_json.hpp"
#include <httplib.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace cr {

namespace {

// Upload and engine share one lifetime: the chunked provider outlives the
// handler, so both live behind a shared_ptr captured by the provider.
struct Job {
  std::istringstream in;
  ReflowStream stream;
  std::string filename;

  Job(std::string content, EngineConfig cfg, std::string name)
    : in(std::move(content)), stream(in, std::move(cfg)), filename(std::move(name)) {}
};

constexpr std::size_t kFlushBytes = 64 * 1024;

void send_error(httplib::Response& res, int status, std::string_view msg,
                ErrorKind kind = ErrorKind::None) {
  res.status = status;
  res.set_content(RunJsonWriter::error_json(msg, kind), "application/json; charset=utf-8");
}

std::string form_value(const httplib::Request& req, const char* key) {
  if (req.has_file(key)) return req.get_file_value(key).content;
  if (req.has_param(key)) return req.get_param_value(key);
  return {};
}

}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  int port{-1};

  explicit Impl(Config c) : cfg(std::move(c)) {}

  // "10MB", or "4KB" when the limit is not a whole MiB
  std::string limit_text() const {
    const std::size_t b = cfg.max_upload_bytes;
    return (b % (1024 * 1024) == 0) ? std::to_string(b / (1024 * 1024)) + "MB"
                                    : std::to_string(b / 1024) + "KB";
  }

  std::string too_large_message() const {
    return "File too large. Maximum size allowed is " + limit_text() + ".";
  }

  std::string index_html() const {
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>csv-reflow</title></head><body>";
    html += "<h1>csv-reflow</h1><p>POST a CSV file to <code>/process-csv/</code> as multipart/form-data.</p><ul>";
    html += "<li><code>file</code>: the .csv file (max " + limit_text() + ")</li>";
    html += "<li><code>delimiter</code>: output delimiter (, ; | : tab space), default tab</li>";
    html += "<li><code>encoding</code>: utf-8 (default), latin-1, ascii, cp1252, utf-16 or another iconv charset</li>";
    html += "</ul><form method='post' action='/process-csv/' enctype='multipart/form-data'>";
    html += "<input type='file' name='file'> <input name='delimiter' value='|' size='5'> ";
    html += "<input name='encoding' value='utf-8' size='10'> <button>Convert</button></form></body></html>";
    return html;
  }

  void process(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_file("file")) { send_error(res, 400, "file: this field is required"); return; }
    const auto file = req.get_file_value("file");

    if (file.content.size() > cfg.max_upload_bytes) {
      send_error(res, 413, too_large_message());
      return;
    }
    if (detect_format(file.filename) != FileFormat::CSV) {
      send_error(res, 400, "Only CSV files are allowed.");
      return;
    }

    EngineConfig ecfg = cfg.engine;
    std::string err;
    if (!normalize_delimiter(form_value(req, "delimiter"), &ecfg.output_delimiter, &err)) {
      send_error(res, 400, err, ErrorKind::ConfigurationInvalid);
      return;
    }
    const std::string enc = form_value(req, "encoding");
    if (!parse_charset(enc, &ecfg.encoding)) {
      send_error(res, 400, "Unsupported encoding: " + enc, ErrorKind::ConfigurationInvalid);
      return;
    }

    auto job = std::make_shared<Job>(file.content, std::move(ecfg), file.filename);
    if (!cfg.quiet) {
      std::string name = file.filename;
      job->stream.on_warning([name](const MalformedRecord& m) {
        std::cerr << "[serve] " << name << ": line " << m.line << " has " << m.actual_fields
                  << " fields, expected " << m.expected_fields << "; skipped\n";
      });
    }

    if (!job->stream.prime()) {
      const auto& e = job->stream.error();
      switch (e.kind) {
        case ErrorKind::EmptyInput:
          send_error(res, 400, "The uploaded CSV file is empty.", e.kind); break;
        case ErrorKind::DecodeFailure:
          send_error(res, 400, "Encoding error: " + e.message + ". Check the file encoding.", e.kind); break;
        case ErrorKind::ParseFailure:
          send_error(res, 400, "Error parsing CSV file: " + e.message, e.kind); break;
        case ErrorKind::ConfigurationInvalid:
          send_error(res, 400, e.message, e.kind); break;
        default:
          send_error(res, 500, "Processing error: " + e.message, e.kind); break;
      }
      std::cerr << "[serve] rejected " << job->filename << ": " << error_kind_name(e.kind) << "\n";
      return;
    }

    res.set_header("Content-Disposition", "attachment; filename=\"output.txt\"");
    res.set_chunked_content_provider(
      "text/plain; charset=utf-8",
      [job](size_t /*offset*/, httplib::DataSink& sink) {
        std::string buf, line;
        while (buf.size() < kFlushBytes && job->stream.next(line)) buf += line;
        if (!buf.empty()) {
          if (!sink.write(buf.data(), buf.size())) { job->stream.close(); return false; }
          return true;
        }
        if (job->stream.error()) {
          // headers are gone already; dropping the connection marks the body as failed
          std::cerr << "[serve] aborted " << job->filename << ": "
                    << job->stream.error().message << "\n";
          return false;
        }
        sink.done();
        return true;
      },
      [job](bool success) {
        job->stream.close();
        const auto s = job->stream.stats();
        std::cerr << "[serve] " << (success ? "done " : "failed ") << job->filename
                  << " records=" << s.records << " lines=" << s.lines
                  << " malformed=" << s.malformed << "\n";
      });
  }

  void routes() {
    svr.set_payload_max_length(cfg.max_upload_bytes + 64 * 1024);

    // Rejections raised by httplib itself (oversized body, unknown route)
    // get the same JSON body as the handlers' own errors.
    svr.set_error_handler([this](const httplib::Request&, httplib::Response& res) {
      if (!res.body.empty()) return;
      if (res.status == 413) {
        send_error(res, 413, too_large_message());
        return;
      }
      send_error(res, res.status, res.status == 404 ? "Not found." : "Request rejected.");
    });

    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
      res.set_content("ok", "text/plain");
    });

    svr.Post(R"(/process-csv/?)", [this](const httplib::Request& req, httplib::Response& res) {
      process(req, res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->port > 0) return true;
  if (p_->cfg.port == 0) {
    p_->port = p_->svr.bind_to_any_port(p_->cfg.host);
  } else if (p_->svr.bind_to_port(p_->cfg.host, p_->cfg.port)) {
    p_->port = p_->cfg.port;
  }
  return p_->port > 0;
}

int HttpServer::bound_port() const noexcept { return p_->port; }

int HttpServer::run() {
  if (!start()) return -1;
  std::cerr << "[serve] listening on " << p_->cfg.host << ":" << p_->port << "\n";
  p_->svr.listen_after_bind();
  return 0;
}

void HttpServer::stop() { p_->svr.stop(); }

}
