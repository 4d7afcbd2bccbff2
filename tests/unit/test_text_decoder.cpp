#include "csv_reflow/chunk_reader.hpp"
#include "csv_reflow/text_decoder.hpp"
#include "csv_reflow/utf8.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::vector<std::string> read_all(cr::ChunkReader& r) {
  std::vector<std::string> out;
  std::string_view s;
  while (r.read_next(s)) out.emplace_back(s);
  return out;
}

int main(){
  // charset names
  {
    cr::Charset cs;
    if (!cr::parse_charset("UTF-8", &cs) || cs.kind != cr::Encoding::Utf8) { std::cerr << "[FAIL] UTF-8\n"; return 1; }
    if (!cr::parse_charset("", &cs) || cs.kind != cr::Encoding::Utf8) { std::cerr << "[FAIL] empty name\n"; return 1; }
    if (!cr::parse_charset("ISO-8859-1", &cs) || cs.kind != cr::Encoding::Latin1) { std::cerr << "[FAIL] ISO-8859-1\n"; return 1; }
    if (!cr::parse_charset("us-ascii", &cs) || cs.kind != cr::Encoding::Ascii) { std::cerr << "[FAIL] us-ascii\n"; return 1; }
    if (!cr::parse_charset("Windows-1252", &cs) || !cs.transcoded()) { std::cerr << "[FAIL] windows-1252\n"; return 1; }
    if (!cr::parse_charset("cp1252", &cs) || cr::charset_name(cs) != "cp1252") { std::cerr << "[FAIL] cp1252\n"; return 1; }
    if (!cr::parse_charset("UTF_16_LE", &cs) || cs.label != "utf-16le") {
      std::cerr << "[FAIL] UTF_16_LE -> [" << cs.label << "]\n"; return 1;
    }
    if (cr::parse_charset("no-such-charset", &cs)) { std::cerr << "[FAIL] unknown charset accepted\n"; return 1; }
  }

  std::string out;
  {
    cr::TextDecoder d(cr::Encoding::Utf8);
    if (!d.decode_line("Z\xC3\xBCrich", out) || out != "Z\xC3\xBCrich") { std::cerr << "[FAIL] valid utf-8\n"; return 1; }
    if (d.decode_line("ok\xFFno", out) || !out.empty() || d.error().find("byte 2") == std::string::npos) {
      std::cerr << "[FAIL] invalid utf-8: " << d.error() << "\n"; return 1;
    }
    if (d.decode_line("cut \xE2\x82", out)) { std::cerr << "[FAIL] truncated sequence accepted\n"; return 1; }
  }
  {
    cr::TextDecoder d(cr::Encoding::Latin1);
    if (!d.decode_line("Jos\xe9", out) || out != "Jos\xC3\xA9" || cr::utf8_length(out) != 4) {
      std::cerr << "[FAIL] latin-1\n"; return 1;
    }
  }
  {
    cr::TextDecoder d(cr::Encoding::Ascii);
    if (!d.decode_line("plain", out) || d.decode_line("caf\xC3\xA9", out)) { std::cerr << "[FAIL] ascii\n"; return 1; }
  }

  // sequences split across chunks, invalid and truncated input
  {
    cr::StreamTranscoder t("utf-16le");
    std::string u;
    if (!t.convert(std::string("a\x00\xe9", 3), false, u) || u != "a") { std::cerr << "[FAIL] split utf-16 first half\n"; return 1; }
    if (!t.convert(std::string("\x00", 1), true, u) || u != "a\xC3\xA9") { std::cerr << "[FAIL] split utf-16 second half\n"; return 1; }

    cr::StreamTranscoder odd("utf-16le");
    std::string v;
    if (odd.convert(std::string("a\x00" "b", 3), true, v) || odd.error().find("incomplete") == std::string::npos) {
      std::cerr << "[FAIL] odd utf-16 length not reported\n"; return 1;
    }

    cr::StreamTranscoder bad("cp1252");
    std::string w;
    if (bad.convert("ab\x81" "c", true, w) || w != "ab" || bad.error().find("byte 2") == std::string::npos) {
      std::cerr << "[FAIL] cp1252 0x81: [" << w << "] " << bad.error() << "\n"; return 1;
    }
  }

  // cp1252 export read through the chunk reader
  {
    const fs::path f = "tests/data/cp1252.csv";
    if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }
    cr::ChunkReader::Config cfg; cfg.chunk_bytes = 7; cfg.transcode_from = "cp1252";
    cr::ChunkReader r(f.string(), cfg);
    auto lines = read_all(r);
    if (r.decode_failed() || lines.size() != 3) { std::cerr << "[FAIL] cp1252 lines=" << lines.size() << "\n"; return 1; }
    if (lines[1] != "Caf\xC3\xA9,\xE2\x82\xAC 4" ||
        lines[2] != "\xE2\x80\x9CQuoted\xE2\x80\x9D na\xC3\xAFve,\xE2\x82\xAC 12") {
      std::cerr << "[FAIL] cp1252 text: [" << lines[1] << "] [" << lines[2] << "]\n"; return 1;
    }
  }

  // utf-16 with BOM; odd chunk size splits code units
  {
    const fs::path f = "tests/data/utf16.csv";
    if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }
    cr::ChunkReader::Config cfg; cfg.chunk_bytes = 5; cfg.transcode_from = "utf-16";
    cr::ChunkReader r(f.string(), cfg);
    auto lines = read_all(r);
    if (r.decode_failed() || lines.size() != 3) { std::cerr << "[FAIL] utf-16 lines=" << lines.size() << "\n"; return 1; }
    if (lines[0] != "name,city" || lines[1] != "Jos\xC3\xA9,Z\xC3\xBCrich" || lines[2] != "Ren\xC3\xA9" "e,M\xC3\xA1laga") {
      std::cerr << "[FAIL] utf-16 text: [" << lines[0] << "] [" << lines[1] << "]\n"; return 1;
    }
    if (r.bytes_read() != fs::file_size(f)) { std::cerr << "[FAIL] utf-16 bytes_read=" << r.bytes_read() << "\n"; return 1; }
  }

  // lines before an invalid byte are delivered, then the reader stops
  {
    std::istringstream in("a\nb\nc\x81" "d\ne\n");
    cr::ChunkReader::Config cfg; cfg.transcode_from = "cp1252";
    cr::ChunkReader r(in, cfg);
    auto lines = read_all(r);
    if (lines.size() != 2 || !r.decode_failed() || r.lines_read() != 2 || r.failed()) {
      std::cerr << "[FAIL] decode stop: lines=" << lines.size() << " err=" << r.decode_error() << "\n"; return 1;
    }
  }

  // code point helpers
  if (cr::utf8_length("\xC3\xA9t\xC3\xA9") != 3 || cr::utf8_prefix_bytes("\xC3\xA9t\xC3\xA9", 2) != 3 ||
      cr::utf8_prefix_bytes("abc", 10) != 3) {
    std::cerr << "[FAIL] utf8 length helpers\n"; return 1;
  }
  std::string padded;
  cr::append_padded(padded, "\xC3\xA9", 3);
  if (padded != "\xC3\xA9  ") { std::cerr << "[FAIL] append_padded\n"; return 1; }
  if (!cr::iequals("Tab", "TAB") || cr::iequals("tab", "tabs")) { std::cerr << "[FAIL] iequals\n"; return 1; }

  std::cout << "[PASS] text_decoder\n";
  return 0;
}
