#pragma once
#include "csv_reflow/record_view.hpp"
#include <cstddef>
#include <vector>

namespace cr {

struct WidthLimits {
  std::size_t floor      = 15;
  std::size_t ceiling    = 30;
  double      percentile = 0.90;
};

// Display width per column position, in code points.
using ColumnWidths = std::vector<std::size_t>;

// Percentile by linear interpolation between closest ranks
// (pos = q * (n - 1)). Sorts `values` in place; `values` must not be empty.
double percentile_linear(std::vector<std::size_t>& values, double q);

// Width for one column: max(H, min(trunc(P), ceiling)), then at least floor.
// With no non-null values the statistic is skipped and H is used.
std::size_t column_width(std::size_t header_len, std::vector<std::size_t>& value_lens,
                         const WidthLimits& lim);

// Recomputed from scratch for every batch; nothing carries over.
ColumnWidths estimate_widths(const RecordBatch& batch, const WidthLimits& lim);

}
