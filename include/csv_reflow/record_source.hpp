#pragma once
#include "csv_reflow/engine_config.hpp"
#include "csv_reflow/errors.hpp"
#include "csv_reflow/record_view.hpp"
#include "csv_reflow/text_decoder.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cr {

class ChunkReader;

struct SourceConfig {
  char        delimiter        = ',';
  char        quote            = '"';
  Charset     encoding;
  std::size_t batch_size       = 1000;
  std::size_t max_record_bytes = 8 * 1024 * 1024;
  CellPolicy  cells;
};

// Turns physical lines into batches of records that match the header.
// Malformed records are reported through the warning callback and skipped;
// a quoted field left open at the end of input is a ParseFailure.
// The reader is closed once the input is exhausted or a stream error occurs.
class RecordSource {
public:
  using WarningCallback = std::function<void(const MalformedRecord&)>;

  RecordSource(ChunkReader& reader, SourceConfig cfg);
  RecordSource(const RecordSource&) = delete;
  RecordSource& operator=(const RecordSource&) = delete;
  ~RecordSource();

  void on_warning(WarningCallback cb);

  // Reads the header row. False with error() set (EmptyInput, DecodeFailure,
  // ParseFailure, Io).
  bool open();
  const std::vector<std::string>& header() const;

  // Refills `batch` with up to batch_size records, in input order.
  // False when no record is left; error() tells whether that is a failure.
  bool next_batch(RecordBatch& batch);

  const ReflowError& error() const;
  std::uint64_t records() const noexcept;
  std::uint64_t malformed() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
