#include "csv_reflow/text_decoder.hpp"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <simdjson.h>

namespace cr {

namespace {

// "utf_16_le" -> "utf-16le": the spellings iconv does not share with other
// encoding registries.
std::string iconv_label(std::string_view name) {
  std::string s(name);
  for (auto& c : s) c = (c == '_') ? '-' : static_cast<char>(std::tolower((unsigned char)c));
  if (s.size() > 3) {
    const std::string tail = s.substr(s.size() - 3);
    if (tail == "-le" || tail == "-be") s.erase(s.size() - 3, 1);
  }
  return s;
}

}

bool parse_charset(std::string_view name, Charset* out) {
  const std::string n = iconv_label(name);
  if (n.empty() || n == "utf-8" || n == "utf8" || n == "utf-8-sig") { *out = Charset{Encoding::Utf8, {}}; return true; }
  if (n == "latin-1" || n == "latin1" || n == "iso-8859-1" || n == "iso8859-1") { *out = Charset{Encoding::Latin1, {}}; return true; }
  if (n == "ascii" || n == "us-ascii") { *out = Charset{Encoding::Ascii, {}}; return true; }

  iconv_t cd = iconv_open("UTF-8", n.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) return false;
  iconv_close(cd);
  *out = Charset{Encoding::Iconv, n};
  return true;
}

std::string charset_name(const Charset& cs) {
  switch (cs.kind) {
    case Encoding::Utf8:   return "utf-8";
    case Encoding::Latin1: return "latin-1";
    case Encoding::Ascii:  return "ascii";
    case Encoding::Iconv:  return cs.label;
  }
  return "utf-8";
}

// Offset of the first ill-formed sequence; only used for the error message
// once simdjson has rejected the whole line.
static std::size_t first_bad_utf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    const std::size_t n = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
    if (n == 0 || i + n > s.size() || !simdjson::validate_utf8(s.data() + i, n)) return i;
    i += n;
  }
  return s.size();
}

bool TextDecoder::decode_line(std::string_view raw, std::string& out) {
  out.clear();
  err_.clear();
  switch (enc_) {
    case Encoding::Utf8:
    case Encoding::Iconv:
      if (!simdjson::validate_utf8(raw.data(), raw.size())) {
        err_ = "invalid utf-8 byte sequence near byte " + std::to_string(first_bad_utf8(raw));
        return false;
      }
      out.assign(raw.data(), raw.size());
      return true;
    case Encoding::Ascii:
      for (std::size_t i = 0; i < raw.size(); ++i) {
        if (static_cast<unsigned char>(raw[i]) >= 0x80) {
          err_ = "non-ascii byte at offset " + std::to_string(i);
          return false;
        }
      }
      out.assign(raw.data(), raw.size());
      return true;
    case Encoding::Latin1:
      out.reserve(raw.size() + raw.size() / 4);
      for (unsigned char c : raw) {
        if (c < 0x80) { out.push_back(static_cast<char>(c)); continue; }
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
      }
      return true;
  }
  return false;
}

StreamTranscoder::StreamTranscoder(const std::string& from)
  : cd_(iconv_open("UTF-8", from.c_str())) {
  if (!ok()) err_ = "unsupported encoding: " + from;
}

StreamTranscoder::~StreamTranscoder() {
  if (ok()) iconv_close(cd_);
}

bool StreamTranscoder::convert(std::string_view in, bool last, std::string& out) {
  if (!ok()) return false;
  carry_.append(in.data(), in.size());

  char tmp[16 * 1024];
  char* src = carry_.data();
  std::size_t left = carry_.size();
  bool incomplete = false;
  while (left > 0) {
    char* dst = tmp;
    std::size_t room = sizeof(tmp);
    const std::size_t rc = iconv(cd_, &src, &left, &dst, &room);
    out.append(tmp, static_cast<std::size_t>(dst - tmp));
    if (rc != static_cast<std::size_t>(-1)) break;
    const int e = errno;
    if (e == E2BIG) continue;
    if (e == EINVAL) { incomplete = true; break; }
    const std::uint64_t at = consumed_ + static_cast<std::uint64_t>(src - carry_.data());
    err_ = std::string(e == EILSEQ ? "invalid byte sequence" : std::strerror(e)) +
           " near byte " + std::to_string(at);
    return false;
  }

  const std::size_t used = static_cast<std::size_t>(src - carry_.data());
  consumed_ += used;
  carry_.erase(0, used);

  if (last) {
    if (incomplete || !carry_.empty()) {
      err_ = "incomplete byte sequence at end of input (byte " + std::to_string(consumed_) + ")";
      return false;
    }
    char* dst = tmp;
    std::size_t room = sizeof(tmp);
    iconv(cd_, nullptr, nullptr, &dst, &room);   // flush shift state
    out.append(tmp, static_cast<std::size_t>(dst - tmp));
  }
  return true;
}

}
