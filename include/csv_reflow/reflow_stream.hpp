#pragma once
#include "csv_reflow/column_width.hpp"
#include "csv_reflow/dialect_detect.hpp"
#include "csv_reflow/engine_config.hpp"
#include "csv_reflow/errors.hpp"
#include "csv_reflow/metrics.hpp"
#include "csv_reflow/record_source.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace cr {

// One reformatting run. Pull-based: every next() yields exactly one output
// line, so the caller decides when to write it and nothing is buffered
// beyond the current batch. The header line comes first, built from the
// first batch's widths; records follow in input order.
//
// Each instance owns its input and all state; concurrent runs must use
// separate instances.
class ReflowStream {
public:
  ReflowStream(std::string path, EngineConfig cfg);
  ReflowStream(std::istream& in, EngineConfig cfg); // stream must outlive this
  ReflowStream(const ReflowStream&) = delete;
  ReflowStream& operator=(const ReflowStream&) = delete;
  ~ReflowStream();

  // Validates the configuration, detects the delimiter, reads the header and
  // the first batch. Called by the first next(); calling it earlier lets the
  // caller learn about stream-level failures before producing any output.
  bool prime();

  // Next line including the configured terminator. False at the end and on
  // failure; error() tells which.
  bool next(std::string& line);

  // Releases the input now; next() returns false afterwards.
  void close() noexcept;

  bool finished() const noexcept;
  const ReflowError& error() const;

  // Forwarded for every skipped record (after it is counted in metrics).
  void on_warning(RecordSource::WarningCallback cb);

  const DetectionResult& detection() const;
  const std::vector<std::string>& header() const;
  const ColumnWidths& widths() const;      // of the current batch
  const EngineConfig& config() const;
  RunStats stats() const;

private:
  struct Impl; Impl* p_;
};

}
