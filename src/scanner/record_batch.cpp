#include "csv_reflow/record_view.hpp"

namespace cr {

void RecordBatch::clear(const std::vector<std::string>* header) {
  header_ = header;
  arena_.reset();
  cells_.clear();
  lines_.clear();
}

void RecordBatch::append(const std::vector<Cell>& row, std::uint64_t line) {
  for (const auto& c : row) {
    if (c) cells_.emplace_back(arena_.copy(*c));
    else   cells_.emplace_back(std::nullopt);
  }
  lines_.push_back(line);
}

RecordView RecordBatch::row(std::size_t i) const {
  const std::size_t n = columns();
  return RecordView(cells_.data() + i * n, n, lines_[i]);
}

}
