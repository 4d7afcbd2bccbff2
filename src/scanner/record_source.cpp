#include "csv_reflow/record_source.hpp"
#include "csv_reflow/chunk_reader.hpp"
#include "csv_reflow/token_csv_fsm.hpp"
#include <cstring>
#include <string_view>
#include <unordered_set>

namespace cr {

namespace {

bool is_blank(std::string_view s, char delim) {
  for (char c : s) {
    if (c == ' ' && delim != ' ') continue;
    if (c == '\t' && delim != '\t') continue;
    return false;
  }
  return true;
}

// Empty names become "Unnamed: <i>", repeats get ".1", ".2", ...
std::vector<std::string> unique_names(const std::vector<std::string_view>& raw) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    std::string name = raw[i].empty() ? "Unnamed: " + std::to_string(i) : std::string(raw[i]);
    if (seen.count(name)) {
      std::string base = name;
      for (std::size_t k = 1; seen.count(name); ++k) name = base + "." + std::to_string(k);
    }
    seen.insert(name);
    out.push_back(std::move(name));
  }
  return out;
}

}

struct RecordSource::Impl {
  enum class Step { Record, End, Error };

  ChunkReader& reader;
  SourceConfig cfg;
  TextDecoder decoder;
  CsvFsm fsm;

  std::vector<std::string> header;
  std::string decoded;
  std::vector<Cell> row;
  ReflowError err;
  WarningCallback warn_cb;

  std::uint64_t records{0};
  std::uint64_t malformed{0};
  std::uint64_t dropped_seen{0};
  std::uint64_t record_line{0};
  bool first_line{true};
  bool opened{false};
  bool done{false};

  Impl(ChunkReader& r, SourceConfig c)
    : reader(r), cfg(std::move(c)), decoder(cfg.encoding.kind),
      fsm(CsvConfig{cfg.delimiter, cfg.quote, true}) {}

  void warn(std::uint64_t line, std::size_t actual) {
    ++malformed;
    if (warn_cb) warn_cb(MalformedRecord{line, header.size(), actual});
  }

  // Lines the reader dropped for exceeding max_record_bytes. Inside an open
  // quoted field that loses part of the record, so it ends the stream.
  bool note_dropped(std::uint64_t line) {
    if (dropped_seen == reader.dropped_lines()) return true;
    if (fsm.pending()) {
      err = ReflowError{ErrorKind::ParseFailure,
                        "line " + std::to_string(record_line) + ": quoted field runs past line " +
                        std::to_string(line) + ", which exceeds the record size limit",
                        record_line};
      return false;
    }
    while (dropped_seen < reader.dropped_lines()) { ++dropped_seen; warn(line, 0); }
    return true;
  }

  void finish() {
    done = true;
    reader.close();
  }

  std::string declared() const {
    return " (declared encoding " + charset_name(cfg.encoding) + ")";
  }

  Step next_record(std::uint64_t* line) {
    std::string_view raw;
    while (true) {
      if (!reader.read_next(raw)) {
        if (reader.failed()) {
          err = ReflowError{ErrorKind::Io, std::string("read error: ") + std::strerror(reader.last_error()),
                            reader.lines_read()};
          return Step::Error;
        }
        if (reader.decode_failed()) {
          const std::uint64_t ln = reader.lines_read() + 1;
          err = ReflowError{ErrorKind::DecodeFailure,
                            "line " + std::to_string(ln) + ": " + reader.decode_error() + declared(), ln};
          return Step::Error;
        }
        if (!note_dropped(reader.lines_read())) return Step::Error;
        if (fsm.pending()) {
          err = ReflowError{ErrorKind::ParseFailure,
                            "line " + std::to_string(record_line) +
                            ": quoted field is not closed before the end of input",
                            record_line};
          return Step::Error;
        }
        return Step::End;
      }
      const std::uint64_t ln = reader.lines_read();
      if (!note_dropped(ln > 0 ? ln - 1 : 0)) return Step::Error;

      if (first_line) {
        first_line = false;
        if (cfg.encoding.kind != Encoding::Latin1 && cfg.encoding.kind != Encoding::Ascii &&
            raw.size() >= 3 && raw.substr(0, 3) == "\xEF\xBB\xBF")
          raw.remove_prefix(3);
      }

      if (!decoder.decode_line(raw, decoded)) {
        err = ReflowError{ErrorKind::DecodeFailure,
                          "line " + std::to_string(ln) + ": " + decoder.error() + declared(), ln};
        return Step::Error;
      }

      if (!fsm.pending()) {
        if (is_blank(decoded, cfg.delimiter)) continue;
        record_line = ln;
      }
      if (fsm.feed(decoded) == CsvFsm::Feed::NeedMore) {
        if (fsm.pending_bytes() > cfg.max_record_bytes) {
          err = ReflowError{ErrorKind::ParseFailure,
                            "line " + std::to_string(record_line) + ": quoted field exceeds " +
                            std::to_string(cfg.max_record_bytes) + " bytes",
                            record_line};
          return Step::Error;
        }
        continue;
      }
      *line = record_line;
      return Step::Record;
    }
  }
};

RecordSource::RecordSource(ChunkReader& reader, SourceConfig cfg)
  : p_(new Impl(reader, std::move(cfg))) {}

RecordSource::~RecordSource() { delete p_; }

void RecordSource::on_warning(WarningCallback cb) { p_->warn_cb = std::move(cb); }

bool RecordSource::open() {
  if (p_->opened) return !p_->err;
  p_->opened = true;
  if (!p_->reader.is_open()) {
    p_->err = ReflowError{ErrorKind::Io, std::string("cannot open input: ") + std::strerror(p_->reader.last_error()), 0};
    p_->finish();
    return false;
  }
  std::uint64_t line = 0;
  const auto s = p_->next_record(&line);
  if (s == Impl::Step::Error) { p_->finish(); return false; }
  if (s == Impl::Step::End) {
    p_->err = ReflowError{ErrorKind::EmptyInput, "input is empty (no header row)", 0};
    p_->finish();
    return false;
  }
  p_->header = unique_names(p_->fsm.fields());
  return true;
}

const std::vector<std::string>& RecordSource::header() const { return p_->header; }

bool RecordSource::next_batch(RecordBatch& batch) {
  if (!p_->opened || p_->done || p_->err) return false;

  batch.clear(&p_->header);
  const std::size_t ncols = p_->header.size();
  while (batch.rows() < p_->cfg.batch_size) {
    std::uint64_t line = 0;
    const auto s = p_->next_record(&line);
    if (s == Impl::Step::Error) {
      // the failing batch is never handed out half-read
      batch.clear(&p_->header);
      p_->finish();
      return false;
    }
    if (s == Impl::Step::End) { p_->finish(); break; }

    const auto& fields = p_->fsm.fields();
    if (fields.size() != ncols) { p_->warn(line, fields.size()); continue; }

    p_->row.clear();
    for (auto f : fields) {
      if (p_->cfg.cells.is_null_token(f)) p_->row.emplace_back(std::nullopt);
      else p_->row.emplace_back(f);
    }
    batch.append(p_->row, line);
    ++p_->records;
  }

  if (batch.empty()) {
    if (p_->records == 0)
      p_->err = ReflowError{ErrorKind::EmptyInput, "input has a header but no data rows", 0};
    return false;
  }
  return true;
}

const ReflowError& RecordSource::error() const { return p_->err; }
std::uint64_t RecordSource::records() const noexcept { return p_->records; }
std::uint64_t RecordSource::malformed() const noexcept { return p_->malformed; }

}
