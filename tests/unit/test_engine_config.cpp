#include "csv_reflow/engine_config.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

static std::string write_temp(const char* name, const std::string& body) {
  std::string path = std::string("tests/data/") + name;
  std::ofstream f(path, std::ios::binary);
  f << body;
  return path;
}

int main(){
  // delimiter spellings
  {
    const struct { const char* in; char want; } cases[] = {
      {"", '\t'}, {"\\t", '\t'}, {"TAB", '\t'}, {"space", ' '}, {"|", '|'}, {":", ':'},
    };
    for (const auto& c : cases) {
      char d = 0;
      if (!cr::normalize_delimiter(c.in, &d) || d != c.want) {
        std::cerr << "[FAIL] delimiter spelling '" << c.in << "'\n"; return 1;
      }
    }
    char d = 0;
    std::string err;
    if (cr::normalize_delimiter("##", &d, &err) || err.find("invalid delimiter") == std::string::npos) {
      std::cerr << "[FAIL] '##' accepted\n"; return 1;
    }
  }

  // defaults are valid
  {
    cr::EngineConfig cfg;
    std::string err;
    if (!cr::validate_config(cfg, &err)) { std::cerr << "[FAIL] defaults: " << err << "\n"; return 1; }
    if (cfg.output_delimiter != '\t' || cfg.input_delimiter.has_value() || cfg.width_floor != 15u ||
        cfg.width_ceiling != 30u || cfg.batch_size != 1000u || cfg.encoding.kind != cr::Encoding::Utf8) {
      std::cerr << "[FAIL] default values\n"; return 1;
    }
  }

  // overrides
  {
    cr::EngineConfig cfg;
    std::string err;
    if (!cr::apply_setting(cfg, "batch-size", "250", &err) || cfg.batch_size != 250u) { std::cerr << "[FAIL] batch-size\n"; return 1; }
    if (!cr::apply_setting(cfg, "width_ceiling", "40", &err)) { std::cerr << "[FAIL] width_ceiling\n"; return 1; }
    if (!cr::apply_setting(cfg, "percentile", "0.75", &err) || cfg.percentile != 0.75) { std::cerr << "[FAIL] percentile\n"; return 1; }
    if (!cr::apply_setting(cfg, "input-delimiter", ";", &err) || !cfg.input_delimiter || *cfg.input_delimiter != ';') {
      std::cerr << "[FAIL] input-delimiter\n"; return 1;
    }
    if (!cr::apply_setting(cfg, "input_delimiter", "auto", &err) || cfg.input_delimiter.has_value()) {
      std::cerr << "[FAIL] input_delimiter auto\n"; return 1;
    }
    if (!cr::apply_setting(cfg, "encoding", "Latin-1", &err) || cfg.encoding.kind != cr::Encoding::Latin1) {
      std::cerr << "[FAIL] encoding latin-1\n"; return 1;
    }
    if (!cr::apply_setting(cfg, "encoding", "CP1252", &err) || !cfg.encoding.transcoded() ||
        cr::charset_name(cfg.encoding) != "cp1252") {
      std::cerr << "[FAIL] encoding cp1252: " << err << "\n"; return 1;
    }
    if (!cr::apply_setting(cfg, "detect_nulls", "false", &err) || cfg.cells.detect_nulls || cfg.cells.is_null_token("NA")) {
      std::cerr << "[FAIL] detect_nulls\n"; return 1;
    }
    if (!cr::apply_setting(cfg, "line-terminator", "crlf", &err) || cfg.line_terminator != "\r\n") {
      std::cerr << "[FAIL] line-terminator\n"; return 1;
    }
    if (!cr::validate_config(cfg, &err)) { std::cerr << "[FAIL] overrides invalid: " << err << "\n"; return 1; }

    if (cr::apply_setting(cfg, "batch_size", "12x", &err)) { std::cerr << "[FAIL] '12x' accepted\n"; return 1; }
    if (cr::apply_setting(cfg, "encoding", "no-such-charset", &err) || err.find("unsupported encoding") == std::string::npos) {
      std::cerr << "[FAIL] unknown encoding accepted\n"; return 1;
    }
    if (cr::apply_setting(cfg, "colour", "red", &err) || err.find("unknown setting") == std::string::npos) {
      std::cerr << "[FAIL] unknown setting accepted\n"; return 1;
    }
  }

  // out-of-range values
  {
    std::string err;
    cr::EngineConfig a; a.width_floor = 20; a.width_ceiling = 10;
    cr::EngineConfig b; b.batch_size = 0;
    cr::EngineConfig c; c.percentile = 1.5;
    cr::EngineConfig d; d.output_delimiter = '\n';
    if (cr::validate_config(a, &err) || cr::validate_config(b, &err) ||
        cr::validate_config(c, &err) || cr::validate_config(d, &err)) {
      std::cerr << "[FAIL] out-of-range value accepted\n"; return 1;
    }
  }

  // null tokens
  {
    cr::CellPolicy p;
    if (!p.is_null_token("") || !p.is_null_token("N/A") || p.is_null_token("none")) { std::cerr << "[FAIL] null tokens\n"; return 1; }
  }

  // JSON config file
  {
    auto path = write_temp("tmp_config.json",
        "{\"delimiter\": \"|\", \"batch_size\": 64, \"percentile\": 0.5, \"detect_nulls\": false, \"encoding\": \"utf-16\"}");
    cr::EngineConfig cfg;
    std::string err;
    const bool ok = cr::load_config_json(path, cfg, &err);
    std::remove(path.c_str());
    if (!ok) { std::cerr << "[FAIL] config file: " << err << "\n"; return 1; }
    if (cfg.output_delimiter != '|' || cfg.batch_size != 64u || cfg.percentile != 0.5 ||
        cfg.cells.detect_nulls || cfg.encoding.label != "utf-16") {
      std::cerr << "[FAIL] config file values\n"; return 1;
    }
  }
  {
    auto path = write_temp("tmp_config_bad.json", "[1, 2, 3]");
    cr::EngineConfig cfg;
    std::string err;
    const bool ok = cr::load_config_json(path, cfg, &err);
    std::remove(path.c_str());
    if (ok || err.empty()) { std::cerr << "[FAIL] non-object config accepted\n"; return 1; }
  }
  {
    cr::EngineConfig cfg;
    std::string err;
    if (cr::load_config_json("tests/data/missing.json", cfg, &err) || err.find("cannot read") == std::string::npos) {
      std::cerr << "[FAIL] missing config file\n"; return 1;
    }
  }

  std::cout << "[PASS] engine_config\n";
  return 0;
}
