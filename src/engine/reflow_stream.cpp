#include "csv_reflow/reflow_stream.hpp"
#include "csv_reflow/chunk_reader.hpp"
#include "csv_reflow/record_view.hpp"
#include "csv_reflow/row_formatter.hpp"
#include <chrono>
#include <memory>

namespace cr {

namespace {

ChunkReader::Config reader_config(const EngineConfig& cfg) {
  ChunkReader::Config rc;
  rc.max_record_bytes = cfg.max_record_bytes;
  if (cfg.encoding.transcoded()) rc.transcode_from = cfg.encoding.label;
  return rc;
}

}

struct ReflowStream::Impl {
  enum class State { Init, Header, Rows, Done };

  EngineConfig cfg;
  std::unique_ptr<ChunkReader> reader;
  std::unique_ptr<RecordSource> source;
  RowFormatter formatter;
  MetricsRegistry metrics;
  RecordSource::WarningCallback warn_cb;

  State state{State::Init};
  ReflowError err;
  DetectionResult detection;
  RecordBatch batch;
  ColumnWidths widths;
  std::size_t next_row{0};
  std::vector<std::string> pending;
  std::size_t next_pending{0};
  std::chrono::steady_clock::time_point t0{std::chrono::steady_clock::now()};

  Impl(std::unique_ptr<ChunkReader> r, EngineConfig c)
    : cfg(std::move(c)), reader(std::move(r)), formatter(cfg.output_delimiter) {}

  bool fail(ReflowError e) {
    err = std::move(e);
    metrics.set_error(err);
    done();
    return false;
  }

  void done() noexcept {
    state = State::Done;
    if (reader) {
      metrics.set_bytes(reader->bytes_read());
      reader->close();
    }
  }

  bool load_batch() {
    metrics.start_stage("read");
    const bool ok = source->next_batch(batch);
    metrics.end_stage("read");
    if (!ok) return false;
    metrics.add_batch();
    metrics.note_batch_bytes(batch.arena().high_water());
    widths = estimate_widths(batch, WidthLimits{cfg.width_floor, cfg.width_ceiling, cfg.percentile});
    next_row = 0;
    return true;
  }

  bool prime() {
    if (state != State::Init) return !err;

    std::string why;
    if (!validate_config(cfg, &why)) return fail(ReflowError{ErrorKind::ConfigurationInvalid, why, 0});
    if (!reader->is_open()) return fail(ReflowError{ErrorKind::Io, "cannot open input", 0});

    metrics.start_stage("detect");
    if (cfg.input_delimiter) {
      detection = DetectionResult{};
      detection.delimiter = *cfg.input_delimiter;
      detection.fallback = false;
    } else {
      DetectionOptions opt;
      opt.min_consistency = cfg.min_consistency;
      bool whole = false;
      const auto sample = reader->peek(cfg.sample_size, &whole);
      detection = detect_delimiter(sample, whole, opt);
    }
    metrics.end_stage("detect");
    metrics.set_delimiter(detection.delimiter, detection.fallback, detection.columns);

    SourceConfig sc;
    sc.delimiter = detection.delimiter;
    sc.encoding = cfg.encoding;
    sc.batch_size = cfg.batch_size;
    sc.max_record_bytes = cfg.max_record_bytes;
    sc.cells = cfg.cells;
    source.reset(new RecordSource(*reader, sc));
    source->on_warning([this](const MalformedRecord& m) {
      metrics.add_malformed(m);
      if (warn_cb) warn_cb(m);
    });

    if (!source->open()) return fail(source->error());
    metrics.set_delimiter(detection.delimiter, detection.fallback, source->header().size());
    if (!load_batch()) return fail(source->error());

    state = State::Header;
    return true;
  }

  bool next(std::string& line) {
    if (state == State::Init && !prime()) return false;
    if (state == State::Done) return false;

    if (state == State::Header) {
      line = formatter.header_line(source->header(), widths);
      line += cfg.line_terminator;
      metrics.add_lines(1);
      state = State::Rows;
      return true;
    }

    while (true) {
      if (next_pending < pending.size()) {
        line = std::move(pending[next_pending++]);
        line += cfg.line_terminator;
        metrics.add_lines(1);
        return true;
      }
      if (next_row < batch.rows()) {
        metrics.start_stage("format");
        formatter.format(batch.row(next_row++), widths, pending);
        metrics.end_stage("format");
        metrics.add_record();
        next_pending = 0;
        continue;
      }
      if (!load_batch()) {
        if (source->error()) return fail(source->error());
        done();
        return false;
      }
    }
  }
};

ReflowStream::ReflowStream(std::string path, EngineConfig cfg) {
  auto rc = reader_config(cfg);
  p_ = new Impl(std::unique_ptr<ChunkReader>(new ChunkReader(std::move(path), rc)), std::move(cfg));
}

ReflowStream::ReflowStream(std::istream& in, EngineConfig cfg) {
  auto rc = reader_config(cfg);
  p_ = new Impl(std::unique_ptr<ChunkReader>(new ChunkReader(in, rc)), std::move(cfg));
}

ReflowStream::~ReflowStream() { delete p_; }

bool ReflowStream::prime() { return p_->prime(); }
bool ReflowStream::next(std::string& line) { return p_->next(line); }
void ReflowStream::close() noexcept { p_->done(); }
bool ReflowStream::finished() const noexcept { return p_->state == Impl::State::Done; }
const ReflowError& ReflowStream::error() const { return p_->err; }
void ReflowStream::on_warning(RecordSource::WarningCallback cb) { p_->warn_cb = std::move(cb); }
const DetectionResult& ReflowStream::detection() const { return p_->detection; }
const ColumnWidths& ReflowStream::widths() const { return p_->widths; }
const EngineConfig& ReflowStream::config() const { return p_->cfg; }

const std::vector<std::string>& ReflowStream::header() const {
  static const std::vector<std::string> none;
  return p_->source ? p_->source->header() : none;
}

RunStats ReflowStream::stats() const {
  const double wall_ms = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - p_->t0).count();
  RunStats s = p_->metrics.snapshot(wall_ms);
  if (p_->state != Impl::State::Done && p_->reader) s.bytes = p_->reader->bytes_read();
  return s;
}

}
