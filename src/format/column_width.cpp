#include "csv_reflow/column_width.hpp"
#include "csv_reflow/utf8.hpp"
#include <algorithm>
#include <cmath>

namespace cr {

double percentile_linear(std::vector<std::size_t>& values, double q) {
  std::sort(values.begin(), values.end());
  if (values.size() == 1) return static_cast<double>(values[0]);
  const double pos  = q * static_cast<double>(values.size() - 1);
  const auto   lo   = static_cast<std::size_t>(std::floor(pos));
  const auto   hi   = std::min(lo + 1, values.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  const double a = static_cast<double>(values[lo]);
  const double b = static_cast<double>(values[hi]);
  // lerp from the nearer end so exact ranks stay exact
  return frac < 0.5 ? a + (b - a) * frac : b - (b - a) * (1.0 - frac);
}

std::size_t column_width(std::size_t header_len, std::vector<std::size_t>& value_lens,
                         const WidthLimits& lim) {
  std::size_t w = header_len;
  if (!value_lens.empty()) {
    const auto p = static_cast<std::size_t>(percentile_linear(value_lens, lim.percentile));
    w = std::max(header_len, std::min(p, lim.ceiling));
  }
  return std::max(w, lim.floor);
}

ColumnWidths estimate_widths(const RecordBatch& batch, const WidthLimits& lim) {
  const std::size_t ncols = batch.columns();
  ColumnWidths widths(ncols, lim.floor);
  std::vector<std::size_t> lens;
  lens.reserve(batch.rows());
  for (std::size_t c = 0; c < ncols; ++c) {
    lens.clear();
    for (std::size_t r = 0; r < batch.rows(); ++r) {
      const Cell& cell = batch.cell(r, c);
      if (cell) lens.push_back(utf8_length(*cell));
    }
    widths[c] = column_width(utf8_length(batch.header()[c]), lens, lim);
  }
  return widths;
}

}
