#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace cr {

// Pull-based physical line reader over a file or a borrowed std::istream.
// Reads fixed-size chunks so memory does not grow with the input; only the
// current line is ever materialised.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 64 * 1024;       // 64 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    std::string transcode_from;                     // iconv charset; empty: bytes as read
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ChunkReader(std::istream& in, Config cfg);   // stream must outlive the reader

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;
  ~ChunkReader();

  bool is_open() const noexcept;

  // Next line without its terminator. `out` stays valid until the next call.
  // Returns false at end of input or on a read error (see failed()).
  bool read_next(std::string_view& out);

  // Up to `n` bytes from the current position without consuming them.
  // `*whole_input` is set when the returned bytes are everything left.
  std::string_view peek(std::size_t n, bool* whole_input = nullptr);

  // Releases the underlying file. Further reads return false.
  void close() noexcept;

  bool failed() const noexcept;
  int  last_error() const noexcept;
  // Transcoding stopped at an invalid or truncated sequence. Lines before
  // the offending one are still delivered; read_next() then returns false.
  bool decode_failed() const noexcept;
  const std::string& decode_error() const;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;   // physical lines incl. dropped
  std::uint64_t dropped_lines() const noexcept; // lines over max_record_bytes

private:
  struct Impl; Impl* p_;
};

}
