#include "csv_reflow/chunk_reader.hpp"
#include "csv_reflow/text_decoder.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <istream>
#include <memory>
#include <string_view>
#include <vector>

namespace cr {

struct ChunkReader::Impl {
  Config cfg;
  std::FILE* file{nullptr};
  std::istream* stream{nullptr};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};
  std::uint64_t dropped{0};

  std::vector<char> buf;
  std::size_t head{0}, tail{0};
  std::string carry;

  std::unique_ptr<StreamTranscoder> transcoder;
  std::vector<char> raw;
  std::string converted;
  std::string decode_err;

  explicit Impl(Config c) : cfg(std::move(c)) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 64 * 1024;
    if (!cfg.transcode_from.empty()) transcoder.reset(new StreamTranscoder(cfg.transcode_from));
  }

  ~Impl() { release(); }

  void release() noexcept {
    if (file) { std::fclose(file); file = nullptr; }
    stream = nullptr;
    eof = true;
  }

  // Up to `cap` bytes from the source; 0 at end of input or on error.
  std::size_t read_raw(char* dst, std::size_t cap) {
    if (file) {
      const std::size_t n = std::fread(dst, 1, cap, file);
      if (n == 0 && std::ferror(file)) { last_errno = errno ? errno : EIO; release(); }
      return n;
    }
    if (stream) {
      stream->read(dst, static_cast<std::streamsize>(cap));
      const auto n = static_cast<std::size_t>(stream->gcount());
      if (stream->bad()) { last_errno = EIO; release(); return 0; }
      return n;
    }
    return 0;
  }

  void compact() {
    if (head > 0) {
      std::memmove(buf.data(), buf.data() + head, tail - head);
      tail -= head; head = 0;
    }
  }

  // Compacts unread bytes to the front and appends one chunk.
  bool fill() {
    if (eof) return false;
    if (transcoder) return fill_transcoded();
    compact();
    if (buf.size() < tail + cfg.chunk_bytes) buf.resize(tail + cfg.chunk_bytes);

    const std::size_t n = read_raw(buf.data() + tail, cfg.chunk_bytes);
    if (last_errno != 0) return false;
    if (n == 0) { eof = true; return false; }
    tail += n;
    bytes += n;
    return true;
  }

  // As fill(), with the chunk converted to UTF-8 first. On a conversion
  // error the text before the bad sequence is still appended.
  bool fill_transcoded() {
    if (!transcoder->ok()) { decode_err = transcoder->error(); eof = true; return false; }
    compact();
    if (raw.size() < cfg.chunk_bytes) raw.resize(cfg.chunk_bytes);

    converted.clear();
    while (converted.empty() && !eof) {
      const std::size_t n = read_raw(raw.data(), cfg.chunk_bytes);
      if (last_errno != 0) return false;
      bytes += n;
      const bool last = (n == 0);
      if (!transcoder->convert(std::string_view(raw.data(), n), last, converted)) {
        decode_err = transcoder->error();
        eof = true;
      } else if (last) {
        eof = true;
      }
    }
    if (converted.empty()) return false;
    if (buf.size() < tail + converted.size()) buf.resize(tail + converted.size());
    std::memcpy(buf.data() + tail, converted.data(), converted.size());
    tail += converted.size();
    return true;
  }

  std::string_view finish_line(std::string_view out) const {
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
    return out;
  }

  bool read_next(std::string_view& out) {
    carry.clear();
    bool skipping_oversize = false; // drop until next newline
    bool pending = false;           // bytes seen for the current line

    while (true) {
      std::string_view block(buf.data() + head, tail - head);
      const std::size_t pos = block.find('\n');
      if (pos != std::string_view::npos) {
        std::string_view slice = block.substr(0, pos);
        head += pos + 1;
        ++lines;
        if (skipping_oversize || carry.size() + slice.size() > cfg.max_record_bytes) {
          ++dropped;
          skipping_oversize = false; pending = false;
          carry.clear();
          continue;
        }
        if (carry.empty()) { out = finish_line(slice); return true; }
        carry.append(slice);
        out = finish_line(carry);
        return true;
      }

      // unfinished line; keep it and pull the next chunk
      if (!block.empty()) {
        pending = true;
        if (!skipping_oversize) {
          if (carry.size() + block.size() > cfg.max_record_bytes) {
            skipping_oversize = true;
            carry.clear();
          } else {
            carry.append(block);
          }
        }
        head = tail;
      }
      if (!fill()) {
        if (last_errno != 0 || !decode_err.empty()) return false;
        if (!pending) return false;
        ++lines;
        if (skipping_oversize) { ++dropped; return false; }
        out = finish_line(carry);
        return true;
      }
    }
  }

  std::string_view peek(std::size_t n, bool* whole) {
    while (tail - head < n && fill()) {}
    const std::size_t avail = tail - head;
    if (whole) *whole = eof && avail <= n;
    return std::string_view(buf.data() + head, avail < n ? avail : n);
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl(cfg)) {
  p_->file = std::fopen(path.c_str(), "rb");
  if (!p_->file) { p_->last_errno = errno; p_->eof = true; }
}

ChunkReader::ChunkReader(std::istream& in, Config cfg)
  : p_(new Impl(cfg)) {
  p_->stream = &in;
}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::is_open() const noexcept { return p_->file != nullptr || p_->stream != nullptr; }
bool ChunkReader::read_next(std::string_view& out) { return p_->read_next(out); }
std::string_view ChunkReader::peek(std::size_t n, bool* whole_input) { return p_->peek(n, whole_input); }
void ChunkReader::close() noexcept { p_->release(); p_->head = p_->tail = 0; }
bool ChunkReader::failed() const noexcept { return p_->last_errno != 0; }
bool ChunkReader::decode_failed() const noexcept { return !p_->decode_err.empty(); }
const std::string& ChunkReader::decode_error() const { return p_->decode_err; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }
std::uint64_t ChunkReader::dropped_lines() const noexcept { return p_->dropped; }

}
