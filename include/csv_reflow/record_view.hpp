#pragma once
#include "csv_reflow/arena.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cr {

// A cell is text or null; nothing is ever typed beyond that.
using Cell = std::optional<std::string_view>;

// Lightweight view over one record of a batch.
class RecordView {
public:
  RecordView() = default;
  RecordView(const Cell* cells, std::size_t n, std::uint64_t line)
      : cells_(cells), n_(n), line_(line) {}

  std::size_t size() const noexcept { return n_; }

  const Cell& at(std::size_t i) const { return cells_[i]; }

  // Null cells read as empty text.
  std::string_view text(std::size_t i) const {
    return (i < n_ && cells_[i]) ? *cells_[i] : std::string_view{};
  }

  // Physical input line the record started on.
  std::uint64_t line() const noexcept { return line_; }

private:
  const Cell* cells_{nullptr};
  std::size_t n_{0};
  std::uint64_t line_{0};
};

// Row-major storage for up to batch_size records. Cell text lives in the
// batch arena and is released by clear().
class RecordBatch {
public:
  RecordBatch() = default;

  void clear(const std::vector<std::string>* header);
  void append(const std::vector<Cell>& row, std::uint64_t line);

  std::size_t rows() const noexcept { return lines_.size(); }
  std::size_t columns() const noexcept { return header_ ? header_->size() : 0; }
  bool empty() const noexcept { return lines_.empty(); }

  const std::vector<std::string>& header() const { return *header_; }
  const Cell& cell(std::size_t row, std::size_t col) const { return cells_[row * columns() + col]; }
  RecordView row(std::size_t i) const;

  const Arena& arena() const noexcept { return arena_; }

private:
  const std::vector<std::string>* header_{nullptr};
  Arena arena_;
  std::vector<Cell> cells_;
  std::vector<std::uint64_t> lines_;
};

}
