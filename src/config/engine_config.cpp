#include "csv_reflow/engine_config.hpp"
#include "csv_reflow/utf8.hpp"
#include <cctype>
#include <charconv>
#include <fast_float/fast_float.h>
#include <simdjson.h>

namespace cr {

static bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

bool CellPolicy::is_null_token(std::string_view s) const {
  if (!detect_nulls) return false;
  for (const auto& n : null_tokens) if (s == n) return true;
  return false;
}

bool normalize_delimiter(std::string_view spelled, char* out, std::string* err_out) {
  if (spelled.empty())                                  { *out = '\t'; return true; }
  if (spelled == "\\t" || spelled == "\t" || iequals(spelled, "tab")) { *out = '\t'; return true; }
  if (spelled == " " || iequals(spelled, "space"))          { *out = ' ';  return true; }
  if (spelled.size() == 1) {
    switch (spelled[0]) {
      case ',': case ';': case '|': case ':':
        *out = spelled[0];
        return true;
      default: break;
    }
  }
  return fail(err_out, "invalid delimiter '" + std::string(spelled) +
                       "'; use one of: comma, semicolon, tab, space, pipe, colon");
}

static bool parse_size(std::string_view v, std::size_t* out) {
  std::size_t x = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
  if (ec != std::errc() || ptr != v.data() + v.size()) return false;
  *out = x;
  return true;
}

static bool parse_double(std::string_view v, double* out) {
  double x = 0.0;
  auto [ptr, ec] = fast_float::from_chars(v.data(), v.data() + v.size(), x);
  if (ec != std::errc() || ptr != v.data() + v.size()) return false;
  *out = x;
  return true;
}

static bool parse_flag(std::string_view v, bool* out) {
  if (v.empty() || iequals(v, "true") || v == "1" || iequals(v, "yes")) { *out = true; return true; }
  if (iequals(v, "false") || v == "0" || iequals(v, "no")) { *out = false; return true; }
  return false;
}

bool apply_setting(EngineConfig& cfg, std::string_view key_in, std::string_view value,
                   std::string* err_out) {
  std::string key(key_in);
  for (auto& c : key) if (c == '-') c = '_';
  const std::string bad = "invalid value for " + key + ": '" + std::string(value) + "'";

  if (key == "delimiter" || key == "output_delimiter")
    return normalize_delimiter(value, &cfg.output_delimiter, err_out);
  if (key == "input_delimiter") {
    if (value.empty() || iequals(value, "auto")) { cfg.input_delimiter.reset(); return true; }
    char d = ',';
    if (!normalize_delimiter(value, &d, err_out)) return false;
    cfg.input_delimiter = d;
    return true;
  }
  if (key == "encoding") {
    if (!parse_charset(value, &cfg.encoding)) return fail(err_out, "unsupported encoding: '" + std::string(value) + "'");
    return true;
  }
  if (key == "batch_size")       return parse_size(value, &cfg.batch_size)       || fail(err_out, bad);
  if (key == "width_floor")      return parse_size(value, &cfg.width_floor)      || fail(err_out, bad);
  if (key == "width_ceiling")    return parse_size(value, &cfg.width_ceiling)    || fail(err_out, bad);
  if (key == "sample_size")      return parse_size(value, &cfg.sample_size)      || fail(err_out, bad);
  if (key == "max_record_bytes") return parse_size(value, &cfg.max_record_bytes) || fail(err_out, bad);
  if (key == "percentile")       return parse_double(value, &cfg.percentile)      || fail(err_out, bad);
  if (key == "min_consistency")  return parse_double(value, &cfg.min_consistency) || fail(err_out, bad);
  if (key == "detect_nulls")     return parse_flag(value, &cfg.cells.detect_nulls) || fail(err_out, bad);
  if (key == "line_terminator") {
    if (iequals(value, "lf") || value == "\\n")        cfg.line_terminator = "\n";
    else if (iequals(value, "crlf") || value == "\\r\\n") cfg.line_terminator = "\r\n";
    else cfg.line_terminator = std::string(value);
    return true;
  }
  return fail(err_out, "unknown setting: " + key);
}

bool validate_config(const EngineConfig& cfg, std::string* err_out) {
  if (cfg.output_delimiter == '\n' || cfg.output_delimiter == '\r' || cfg.output_delimiter == '\0')
    return fail(err_out, "output delimiter must not be a line break");
  if (cfg.input_delimiter && (*cfg.input_delimiter == '\n' || *cfg.input_delimiter == '\r' ||
                              *cfg.input_delimiter == '"'))
    return fail(err_out, "input delimiter must not be a line break or quote");
  if (cfg.batch_size < 1 || cfg.batch_size > 1000000)
    return fail(err_out, "batch_size must be in [1, 1000000]");
  if (cfg.width_floor < 1)
    return fail(err_out, "width_floor must be at least 1");
  if (cfg.width_ceiling < cfg.width_floor)
    return fail(err_out, "width_ceiling must not be below width_floor");
  if (!(cfg.percentile > 0.0 && cfg.percentile <= 1.0))
    return fail(err_out, "percentile must be in (0, 1]");
  if (cfg.sample_size < 16)
    return fail(err_out, "sample_size must be at least 16");
  if (!(cfg.min_consistency > 0.0 && cfg.min_consistency <= 1.0))
    return fail(err_out, "min_consistency must be in (0, 1]");
  if (cfg.max_record_bytes < 1024)
    return fail(err_out, "max_record_bytes must be at least 1024");
  if (cfg.line_terminator != "\n" && cfg.line_terminator != "\r\n" && cfg.line_terminator != "\r")
    return fail(err_out, "line_terminator must be LF, CRLF or CR");
  return true;
}

bool load_config_json(const std::string& path, EngineConfig& cfg, std::string* err_out) {
  simdjson::padded_string json;
  if (simdjson::padded_string::load(path).get(json))
    return fail(err_out, "cannot read config file: " + path);

  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  simdjson::ondemand::object obj;
  if (parser.iterate(json).get(doc) || doc.get_object().get(obj))
    return fail(err_out, "config file is not a JSON object: " + path);

  for (auto field : obj) {
    std::string_view key_sv;
    if (field.unescaped_key().get(key_sv)) return fail(err_out, "malformed key in " + path);
    const std::string key(key_sv);

    simdjson::ondemand::value val;
    simdjson::ondemand::json_type type;
    if (field.value().get(val) || val.type().get(type))
      return fail(err_out, "malformed value for " + key + " in " + path);

    std::string text;
    switch (type) {
      case simdjson::ondemand::json_type::string: {
        std::string_view s;
        if (val.get_string().get(s)) return fail(err_out, "malformed string for " + key);
        text.assign(s.data(), s.size());
        break;
      }
      case simdjson::ondemand::json_type::number:
      case simdjson::ondemand::json_type::boolean: {
        std::string_view raw = val.raw_json_token();
        while (!raw.empty() && std::isspace((unsigned char)raw.back())) raw.remove_suffix(1);
        text.assign(raw.data(), raw.size());
        break;
      }
      default:
        return fail(err_out, "unsupported value type for " + key + " in " + path);
    }
    if (!apply_setting(cfg, key, text, err_out)) return false;
  }
  return true;
}

}
