#pragma once
#include "csv_reflow/column_width.hpp"
#include "csv_reflow/record_view.hpp"
#include <string>
#include <vector>

namespace cr {

// Renders records as fixed-width lines. The first line of a record joins the
// padded cells with the delimiter; wrapped overflow goes on continuation
// lines joined by single spaces. A delimiter character inside cell text is
// folded to a space so that only the formatter ever places it.
class RowFormatter {
public:
  explicit RowFormatter(char delimiter) : delim_(delimiter) {}

  std::string header_line(const std::vector<std::string>& header, const ColumnWidths& widths) const;

  // Replaces `lines` with the record's lines (at least one).
  void format(const RecordView& rec, const ColumnWidths& widths, std::vector<std::string>& lines);

private:
  char fold_char() const noexcept;

  char delim_;
  std::vector<std::vector<std::string>> wrapped_;
};

}
