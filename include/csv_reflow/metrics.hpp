#pragma once
#include "csv_reflow/errors.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cr {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  std::uint64_t batches = 0;
  std::uint64_t lines = 0;
  std::uint64_t malformed = 0;
  std::uint64_t peak_batch_bytes = 0;   // cell text held by the largest batch
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;

  char input_delimiter = ',';
  bool delimiter_fallback = false;
  std::size_t columns = 0;

  std::vector<StageTiming> stages;
  std::vector<MalformedRecord> warnings; // first max_warnings only

  ErrorKind error = ErrorKind::None;
  std::string error_message;
};

// Per-invocation counters; one registry per engine, never shared.
class MetricsRegistry {
public:
  explicit MetricsRegistry(std::size_t max_warnings = 100) : max_warnings_(max_warnings) {}

  void add_record() noexcept { ++records_; }
  void add_batch() noexcept { ++batches_; }
  void add_lines(std::uint64_t n) noexcept { lines_ += n; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }
  void set_delimiter(char d, bool fallback, std::size_t columns) noexcept {
    delim_ = d; fallback_ = fallback; columns_ = columns;
  }
  void note_batch_bytes(std::uint64_t b) noexcept { if (b > peak_batch_bytes_) peak_batch_bytes_ = b; }
  void add_malformed(const MalformedRecord& m);
  void set_error(const ReflowError& e);

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::size_t max_warnings_;
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  std::uint64_t batches_{0};
  std::uint64_t lines_{0};
  std::uint64_t malformed_{0};
  std::uint64_t peak_batch_bytes_{0};
  char delim_{','};
  bool fallback_{false};
  std::size_t columns_{0};
  std::vector<MalformedRecord> warnings_;
  ReflowError error_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
