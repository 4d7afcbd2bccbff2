#include "csv_reflow/row_formatter.hpp"
#include "csv_reflow/text_wrap.hpp"
#include "csv_reflow/utf8.hpp"
#include <algorithm>

namespace cr {

// Whitespace delimiters are already folded by wrapping.
char RowFormatter::fold_char() const noexcept {
  return (delim_ == ' ' || delim_ == '\t') ? '\0' : delim_;
}

std::string RowFormatter::header_line(const std::vector<std::string>& header,
                                      const ColumnWidths& widths) const {
  std::string line;
  for (std::size_t c = 0; c < header.size(); ++c) {
    if (c) line.push_back(delim_);
    std::string name = header[c];
    for (auto& ch : name) if (ch == delim_ || ch == '\n' || ch == '\r') ch = ' ';
    append_padded(line, name, widths[c]);
  }
  return line;
}

void RowFormatter::format(const RecordView& rec, const ColumnWidths& widths,
                          std::vector<std::string>& lines) {
  const std::size_t ncols = rec.size();
  wrapped_.resize(ncols);

  std::size_t depth = 1;
  for (std::size_t c = 0; c < ncols; ++c) {
    wrapped_[c] = wrap_text(rec.text(c), widths[c], fold_char());
    depth = std::max(depth, wrapped_[c].size());
  }

  lines.clear();
  lines.reserve(depth);

  std::string first;
  for (std::size_t c = 0; c < ncols; ++c) {
    if (c) first.push_back(delim_);
    append_padded(first, wrapped_[c][0], widths[c]);
  }
  lines.push_back(std::move(first));

  for (std::size_t i = 1; i < depth; ++i) {
    std::string cont;
    for (std::size_t c = 0; c < ncols; ++c) {
      if (c) cont.push_back(' ');
      const auto& segs = wrapped_[c];
      append_padded(cont, i < segs.size() ? std::string_view(segs[i]) : std::string_view(), widths[c]);
    }
    lines.push_back(std::move(cont));
  }
}

}
