#include "csv_reflow/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace cr {

static void esc(std::ostringstream& o, std::string_view s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
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
  const RunStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"records\":" << s.records << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"batches\":" << s.batches << ",";
  o << "\"lines\":" << s.lines << ",";
  o << "\"malformed\":" << s.malformed << ",";
  o << "\"peak_batch_bytes\":" << s.peak_batch_bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"columns\":" << s.columns << ",";
  o << "\"input_delimiter\":"; esc(o, std::string_view(&s.input_delimiter, 1)); o << ",";
  o << "\"delimiter_fallback\":" << (s.delimiter_fallback ? "true" : "false") << ",";
  o << "\"output_delimiter\":"; esc(o, std::string_view(&p.output_delimiter, 1)); o << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_us\":" << s.stages[i].duration_us << "}";
  }
  o << "],";

  o << "\"warnings\":[";
  for (size_t i=0;i<s.warnings.size();++i){
    if (i) o << ",";
    const auto& w = s.warnings[i];
    o << "{"
      << "\"line\":"     << w.line            << ","
      << "\"expected\":" << w.expected_fields << ","
      << "\"actual\":"   << w.actual_fields
      << "}";
  }
  o << "],";

  o << "\"error\":";
  if (s.error == ErrorKind::None) {
    o << "null";
  } else {
    o << "{\"kind\":"; esc(o, error_kind_name(s.error));
    o << ",\"message\":"; esc(o, s.error_message); o << "}";
  }
  o << ",";

  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"encoding\":"; esc(o, p.encoding); o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

std::string RunJsonWriter::error_json(std::string_view message, ErrorKind kind) {
  std::ostringstream o;
  o << "{\"error\":"; esc(o, message);
  if (kind != ErrorKind::None) { o << ",\"kind\":"; esc(o, error_kind_name(kind)); }
  o << "}";
  return o.str();
}

}
