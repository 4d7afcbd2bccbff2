#include "csv_reflow/dialect_detect.hpp"
#include <unordered_map>
#include <vector>

namespace cr {

// Splits the sample into rows, honouring quoted newlines. Blank rows skipped.
static std::vector<std::string_view> sample_rows(std::string_view s, bool whole, char quote) {
  std::vector<std::string_view> rows;
  bool in_quotes = false;
  std::size_t start = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == quote) { in_quotes = !in_quotes; continue; }
    if (c == '\n' && !in_quotes) {
      std::string_view row = s.substr(start, i - start);
      if (!row.empty() && row.back() == '\r') row.remove_suffix(1);
      if (!row.empty()) rows.push_back(row);
      start = i + 1;
    }
  }
  if (whole && start < s.size()) {
    std::string_view row = s.substr(start);
    if (!row.empty() && row.back() == '\r') row.remove_suffix(1);
    if (!row.empty() && !in_quotes) rows.push_back(row);
  }
  return rows;
}

static std::size_t count_fields(std::string_view row, char delim, char quote) {
  std::size_t n = 1;
  bool in_quotes = false;
  for (char c : row) {
    if (c == quote) in_quotes = !in_quotes;
    else if (c == delim && !in_quotes) ++n;
  }
  return n;
}

DetectionResult detect_delimiter(std::string_view sample, bool whole_input,
                                 const DetectionOptions& opt) {
  DetectionResult best;
  // a UTF-8 BOM is not part of the first header name
  if (sample.size() >= 3 && sample.substr(0, 3) == "\xEF\xBB\xBF") sample.remove_prefix(3);

  const auto rows = sample_rows(sample, whole_input, opt.quote);
  best.rows_analyzed = rows.size();
  if (rows.empty()) return best;

  for (char delim : opt.candidates) {
    std::unordered_map<std::size_t, std::size_t> freq;
    for (auto row : rows) ++freq[count_fields(row, delim, opt.quote)];

    std::size_t modal = 0, modal_freq = 0;
    for (const auto& kv : freq) {
      if (kv.second > modal_freq || (kv.second == modal_freq && kv.first > modal)) {
        modal = kv.first; modal_freq = kv.second;
      }
    }
    if (modal < 2) continue;

    const double consistency = static_cast<double>(modal_freq) / rows.size();
    if (consistency < opt.min_consistency) continue;

    const bool better = best.fallback
        || consistency > best.consistency
        || (consistency == best.consistency && modal > best.columns);
    if (better) {
      best.delimiter = delim;
      best.fallback = false;
      best.consistency = consistency;
      best.columns = modal;
    }
  }
  return best;
}

}
