#include "csv_reflow/token_csv_fsm.hpp"

namespace cr {

CsvFsm::CsvFsm(const CsvConfig& cfg) : cfg_(cfg) {}

void CsvFsm::reset() noexcept {
  mode_ = Mode::FieldStart;
  in_record_ = false;
  scratch_.clear();
  bounds_.clear();
  fields_.clear();
  field_begin_ = 0;
}

void CsvFsm::end_field() {
  bounds_.emplace_back(field_begin_, scratch_.size());
  field_begin_ = scratch_.size();
}

CsvFsm::Feed CsvFsm::feed(std::string_view line) {
  if (!in_record_) reset();

  const char delim = cfg_.delimiter;
  const char quote = cfg_.quote;
  for (char c : line) {
    switch (mode_) {
      case Mode::FieldStart:
        if (c == delim) { end_field(); break; }
        if (cfg_.skip_initial_space && (c == ' ' || c == '\t')) break;
        if (c == quote) { mode_ = Mode::Quoted; break; }
        scratch_.push_back(c);
        mode_ = Mode::Unquoted;
        break;
      case Mode::Unquoted:
        if (c == delim) { end_field(); mode_ = Mode::FieldStart; }
        else scratch_.push_back(c);  // a quote mid-field is literal
        break;
      case Mode::Quoted:
        if (c == quote) mode_ = Mode::QuoteInQuoted;
        else scratch_.push_back(c);
        break;
      case Mode::QuoteInQuoted:
        if (c == quote) {
          scratch_.push_back(quote);        // escaped quote
          mode_ = Mode::Quoted;
        } else if (c == delim) {
          end_field();
          mode_ = Mode::FieldStart;
        } else {
          scratch_.push_back(c);            // text after the closing quote
          mode_ = Mode::Unquoted;
        }
        break;
    }
  }

  if (mode_ == Mode::Quoted) {
    scratch_.push_back('\n');
    in_record_ = true;
    return Feed::NeedMore;
  }

  end_field();
  in_record_ = false;
  mode_ = Mode::FieldStart;
  fields_.clear();
  fields_.reserve(bounds_.size());
  for (const auto& b : bounds_) fields_.emplace_back(scratch_.data() + b.first, b.second - b.first);
  return Feed::Record;
}

}
