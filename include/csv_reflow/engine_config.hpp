#pragma once
#include "csv_reflow/text_decoder.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cr {

// Which field texts read as null. Nulls render empty and do not count
// towards column width statistics.
struct CellPolicy {
  bool detect_nulls = true;
  std::vector<std::string> null_tokens = {"", "NA", "N/A", "NaN", "nan", "null", "NULL"};

  bool is_null_token(std::string_view s) const;
};

struct EngineConfig {
  char        output_delimiter = '\t';
  std::optional<char> input_delimiter;   // unset: detect from the sample
  Charset     encoding;         // utf-8
  std::size_t batch_size       = 1000;
  std::size_t width_floor      = 15;
  std::size_t width_ceiling    = 30;
  double      percentile       = 0.90;
  std::size_t sample_size      = 1024;
  double      min_consistency  = 0.8;
  std::size_t max_record_bytes = 8 * 1024 * 1024;
  std::string line_terminator  = "\n";
  CellPolicy  cells;
};

// Rejects out-of-range values before any input is read.
bool validate_config(const EngineConfig& cfg, std::string* err_out = nullptr);

// "\t"/"tab" -> TAB, "space"/" " -> SPACE, ",", ";", "|", ":"; blank -> TAB.
bool normalize_delimiter(std::string_view spelled, char* out, std::string* err_out = nullptr);

// One override, e.g. ("batch-size", "500"). Dashes and underscores are
// interchangeable in keys.
bool apply_setting(EngineConfig& cfg, std::string_view key, std::string_view value,
                   std::string* err_out = nullptr);

// Flat JSON object of settings, e.g. {"batch_size": 500, "delimiter": "|"}.
bool load_config_json(const std::string& path, EngineConfig& cfg, std::string* err_out = nullptr);

}
