#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cr {

struct CsvConfig {
  char delimiter          = ',';
  char quote              = '"';
  bool skip_initial_space = true;  // trim blanks that open a field
};

// Splits decoded physical lines into records. A quoted field may span
// several lines; feed() then asks for more input before yielding.
class CsvFsm {
public:
  enum class Feed { Record, NeedMore };

  explicit CsvFsm(const CsvConfig& cfg);

  Feed feed(std::string_view line);

  // Fields of the last completed record; valid until the next feed().
  const std::vector<std::string_view>& fields() const { return fields_; }

  // True while a quoted field is open across lines.
  bool pending() const noexcept { return in_record_; }
  std::size_t pending_bytes() const noexcept { return scratch_.size(); }

  // Drops a partially accumulated record.
  void reset() noexcept;

private:
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteInQuoted };

  void end_field();

  CsvConfig cfg_;
  Mode mode_{Mode::FieldStart};
  bool in_record_{false};
  std::string scratch_;
  std::size_t field_begin_{0};
  std::vector<std::pair<std::size_t, std::size_t>> bounds_;
  std::vector<std::string_view> fields_;
};

}
