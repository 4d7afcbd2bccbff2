#include "csv_reflow/http_server.hpp"
#include "csv_reflow/path_utils.hpp"
#include "csv_reflow/reflow_stream.hpp"
#include "csv_reflow/run_json.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

enum Exit { kOk = 0, kUsage = 2, kEmpty = 3, kDecode = 4, kIo = 5, kParse = 6 };

struct Cli {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> settings; // applied after the config file
  std::string input;
  std::string out_path;
  std::string stats_path;
  bool quiet = false;
  bool serve = false;
  std::string host = "0.0.0.0";
  int port = 8080;
  std::size_t max_upload_mb = 10;
};

void usage() {
  std::cout <<
    "Usage: csv-reflow [options] <input.csv|->\n"
    "       csv-reflow --serve [--host=ADDR] [--port=N] [--max-upload-mb=N] [options]\n"
    "\n"
    "  --delimiter=D         output delimiter: , ; | : tab space (default tab)\n"
    "  --input-delimiter=D   skip detection and split input on D (default auto)\n"
    "  --encoding=E          utf-8, latin-1, ascii or any iconv charset (default utf-8)\n"
    "  --batch-size=N        records per width estimate (default 1000)\n"
    "  --width-floor=N       minimum column width (default 15)\n"
    "  --width-ceiling=N     maximum content-driven width (default 30)\n"
    "  --percentile=Q        content length percentile (default 0.90)\n"
    "  --sample-size=N       bytes inspected for delimiter detection (default 1024)\n"
    "  --min-consistency=F   detection threshold (default 0.8)\n"
    "  --max-record-bytes=N  longest accepted input line (default 8 MiB)\n"
    "  --line-terminator=T   lf | crlf (default lf)\n"
    "  --no-nulls            keep NA/null tokens as text\n"
    "  --config=FILE.json    settings file, overridden by flags\n"
    "  --out=FILE            write the report to FILE instead of stdout\n"
    "  --stats-json=FILE     write a run summary\n"
    "  --quiet               do not log skipped records\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  static const char* engine_keys[] = {
    "delimiter", "input-delimiter", "encoding", "batch-size", "width-floor",
    "width-ceiling", "percentile", "sample-size", "min-consistency",
    "max-record-bytes", "line-terminator",
  };
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (a == "-h" || a == "--help") { usage(); std::exit(kOk); }
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--out=", &c.out_path)) continue;
    if (eat("--stats-json=", &c.stats_path)) continue;
    if (eat("--host=", &c.host)) continue;
    if (a == "--quiet")    { c.quiet = true; continue; }
    if (a == "--serve")    { c.serve = true; continue; }
    if (a == "--no-nulls") { c.settings.emplace_back("detect-nulls", "false"); continue; }
    std::string v;
    if (eat("--port=", &v)) {
      char* end = nullptr;
      long p = std::strtol(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0' || p < 0 || p > 65535) { std::cerr << "[config] invalid port: " << v << "\n"; return false; }
      c.port = static_cast<int>(p);
      continue;
    }
    if (eat("--max-upload-mb=", &v)) {
      char* end = nullptr;
      unsigned long long mb = std::strtoull(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0' || mb == 0) { std::cerr << "[config] invalid upload limit: " << v << "\n"; return false; }
      c.max_upload_mb = static_cast<std::size_t>(mb);
      continue;
    }
    bool matched = false;
    for (const char* key : engine_keys) {
      const std::string pfx = std::string("--") + key + "=";
      if (a.rfind(pfx, 0) == 0) { c.settings.emplace_back(key, a.substr(pfx.size())); matched = true; break; }
    }
    if (matched) continue;
    if (a.rfind("--", 0) == 0) { std::cerr << "[config] unknown option: " << a << "\n"; return false; }
    if (!c.input.empty()) { std::cerr << "[config] more than one input given\n"; return false; }
    c.input = a;
  }
  return true;
}

bool build_engine_config(const Cli& cli, cr::EngineConfig& cfg) {
  std::string err;
  if (!cli.config_path.empty() && !cr::load_config_json(cli.config_path, cfg, &err)) {
    std::cerr << "[config] " << err << "\n";
    return false;
  }
  for (const auto& kv : cli.settings) {
    if (!cr::apply_setting(cfg, kv.first, kv.second, &err)) {
      std::cerr << "[config] " << err << "\n";
      return false;
    }
  }
  if (!cr::validate_config(cfg, &err)) {
    std::cerr << "[config] " << err << "\n";
    return false;
  }
  return true;
}

int exit_code_for(cr::ErrorKind k) {
  switch (k) {
    case cr::ErrorKind::None:                 return kOk;
    case cr::ErrorKind::EmptyInput:           return kEmpty;
    case cr::ErrorKind::DecodeFailure:        return kDecode;
    case cr::ErrorKind::ParseFailure:         return kParse;
    case cr::ErrorKind::ConfigurationInvalid: return kUsage;
    case cr::ErrorKind::Io:                   return kIo;
  }
  return kIo;
}

bool write_stats(const Cli& cli, const cr::ReflowStream& stream) {
  cr::RunJsonPayload p{};
  p.stats = stream.stats();
  p.filename = cli.input;
  p.encoding = cr::charset_name(stream.config().encoding);
  p.output_delimiter = stream.config().output_delimiter;
  std::error_code ec;
  if (cli.input != "-") p.file_size = std::filesystem::file_size(cli.input, ec);
  if (ec) p.file_size = 0;

  const std::filesystem::path path(cli.stats_path);
  if (!cr::ensure_parent_dirs(path)) { std::cerr << "[reflow] cannot create directory for " << path << "\n"; return false; }
  std::ofstream out(path, std::ios::binary);
  const std::string json = cr::RunJsonWriter::to_json(p);
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) { std::cerr << "[reflow] failed to write " << path << "\n"; return false; }
  return true;
}

int reflow_one_file(const Cli& cli, cr::EngineConfig cfg) {
  if (cli.input != "-" && cr::detect_format(cli.input) != cr::FileFormat::CSV)
    std::cerr << "[reflow] warning: " << cli.input << " has no .csv extension\n";

  std::unique_ptr<cr::ReflowStream> stream;
  if (cli.input == "-") stream.reset(new cr::ReflowStream(std::cin, std::move(cfg)));
  else stream.reset(new cr::ReflowStream(cli.input, std::move(cfg)));

  if (!cli.quiet) {
    stream->on_warning([&cli](const cr::MalformedRecord& m) {
      std::cerr << "[reflow] " << cli.input << ": line " << m.line << " has " << m.actual_fields
                << " fields, expected " << m.expected_fields << "; skipped\n";
    });
  }

  // stream-level failures surface here, before anything is written
  if (!stream->prime()) {
    const auto& e = stream->error();
    std::cerr << "[reflow] " << cr::error_kind_name(e.kind) << ": " << e.message << "\n";
    if (!cli.stats_path.empty()) (void)write_stats(cli, *stream);
    return exit_code_for(e.kind);
  }

  std::ofstream file;
  if (!cli.out_path.empty()) {
    if (!cr::ensure_parent_dirs(cli.out_path)) { std::cerr << "[reflow] cannot create directory for " << cli.out_path << "\n"; return kIo; }
    file.open(cli.out_path, std::ios::binary);
    if (!file) { std::cerr << "[reflow] cannot open " << cli.out_path << "\n"; return kIo; }
  }
  std::ostream& out = cli.out_path.empty() ? std::cout : file;

  std::string line;
  while (stream->next(line)) {
    out << line;
    if (!out) { stream->close(); std::cerr << "[reflow] write failed\n"; return kIo; }
  }
  out.flush();

  const auto& e = stream->error();
  const auto s = stream->stats();
  if (e) {
    // partial output: the caller must treat the report as failed
    std::cerr << "[reflow] " << cr::error_kind_name(e.kind) << ": " << e.message
              << " (output incomplete after " << s.lines << " lines)\n";
  } else {
    const auto& d = stream->detection();
    std::cerr << "[reflow] ok: " << cli.input << " records=" << s.records << " lines=" << s.lines
              << " batches=" << s.batches << " malformed=" << s.malformed
              << " input_delimiter=" << (d.delimiter == '\t' ? std::string("\\t") : std::string(1, d.delimiter))
              << (d.fallback ? " (fallback)" : "") << "\n";
  }
  if (!cli.stats_path.empty() && !write_stats(cli, *stream)) return e ? exit_code_for(e.kind) : kIo;
  return exit_code_for(e.kind);
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(); return kUsage; }

  cr::EngineConfig cfg;
  if (!build_engine_config(cli, cfg)) return kUsage;

  if (cli.serve) {
    cr::HttpServer::Config scfg;
    scfg.host = cli.host;
    scfg.port = cli.port;
    scfg.max_upload_bytes = cli.max_upload_mb * 1024 * 1024;
    scfg.engine = cfg;
    scfg.quiet = cli.quiet;

    cr::HttpServer server(scfg);
    int rc = server.run();
    if (rc != 0) {
      std::cerr << "Server failed to start on port " << scfg.port << "\n";
      return kIo;
    }
    return kOk;
  }

  if (cli.input.empty()) { usage(); return kUsage; }
  return reflow_one_file(cli, std::move(cfg));
}
