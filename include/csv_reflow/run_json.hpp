#pragma once
#include "csv_reflow/metrics.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace cr {

struct RunJsonPayload {
  RunStats stats;

  // Input metadata
  std::string filename;
  std::string encoding;
  char output_delimiter = '\t';
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize the run summary to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);

  // {"error": "..."} plus the kind when one is known.
  static std::string error_json(std::string_view message, ErrorKind kind = ErrorKind::None);
};

}
