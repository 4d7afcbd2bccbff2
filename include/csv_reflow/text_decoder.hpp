#pragma once
#include <cstdint>
#include <iconv.h>
#include <string>
#include <string_view>

namespace cr {

// Utf8, Latin1 and Ascii are decoded line by line. Any other charset iconv
// knows is converted to UTF-8 as chunks are read (Iconv).
enum class Encoding { Utf8, Latin1, Ascii, Iconv };

struct Charset {
  Encoding kind = Encoding::Utf8;
  std::string label;   // iconv name; set for Encoding::Iconv only

  bool transcoded() const noexcept { return kind == Encoding::Iconv; }
};

// Built-ins: "utf-8", "utf8", "utf-8-sig", "latin-1", "latin1",
// "iso-8859-1", "ascii", "us-ascii" (case-insensitive, '_' same as '-').
// Any other name is accepted if iconv can convert it to UTF-8, e.g.
// "cp1252", "utf-16", "utf-16-le". Empty name means utf-8.
bool parse_charset(std::string_view name, Charset* out);
std::string charset_name(const Charset& cs);

// Normalises one physical input line to UTF-8. A line is decoded as a whole
// so a multi-byte sequence is never split across chunk boundaries. Lines of
// a transcoded input are already UTF-8 and are only validated.
class TextDecoder {
public:
  explicit TextDecoder(Encoding enc) : enc_(enc) {}

  // On failure `out` is left empty and error() describes the byte offset.
  bool decode_line(std::string_view raw, std::string& out);

  const std::string& error() const { return err_; }

private:
  Encoding enc_;
  std::string err_;
};

// Converts a byte stream from an iconv charset to UTF-8 chunk by chunk. A
// sequence split across two chunks is carried into the next call.
class StreamTranscoder {
public:
  explicit StreamTranscoder(const std::string& from);
  StreamTranscoder(const StreamTranscoder&) = delete;
  StreamTranscoder& operator=(const StreamTranscoder&) = delete;
  ~StreamTranscoder();

  bool ok() const noexcept { return cd_ != reinterpret_cast<iconv_t>(-1); }

  // Appends the UTF-8 form of `in` to `out`. With `last` set, a sequence
  // still incomplete at the end is an error. After an error, `out` holds
  // everything converted before the offending byte.
  bool convert(std::string_view in, bool last, std::string& out);

  const std::string& error() const { return err_; }

private:
  iconv_t cd_;
  std::string carry_;
  std::string err_;
  std::uint64_t consumed_{0};
};

}
