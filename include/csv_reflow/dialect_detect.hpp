#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace cr {

struct DetectionOptions {
  std::string candidates = ",;\t|:"; // tie-break order
  char   quote           = '"';
  double min_consistency = 0.8;      // fraction of rows matching the modal count
};

struct DetectionResult {
  char        delimiter     = ',';
  bool        fallback      = true; // no candidate qualified
  double      consistency   = 0.0;
  std::size_t columns       = 0;
  std::size_t rows_analyzed = 0;
};

// Guesses the field separator from a bounded prefix of the raw input.
// When `whole_input` is false the trailing partial row is ignored.
// Never fails: an inconclusive sample yields ',' with fallback=true.
DetectionResult detect_delimiter(std::string_view sample, bool whole_input,
                                 const DetectionOptions& opt = {});

}
