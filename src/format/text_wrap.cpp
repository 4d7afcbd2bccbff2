#include "csv_reflow/text_wrap.hpp"
#include "csv_reflow/utf8.hpp"

namespace cr {

namespace {

struct Chunk {
  std::string_view text;
  bool space;
};

bool is_space(char c, char extra) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f' ||
         (extra != '\0' && c == extra);
}

// Words and whitespace runs, in order. `norm` receives the text with all
// whitespace folded to ' ' and must outlive the chunks.
std::vector<Chunk> split_chunks(std::string_view text, char extra, std::string& norm) {
  norm.assign(text.data(), text.size());
  for (auto& c : norm) if (is_space(c, extra)) c = ' ';

  std::vector<Chunk> chunks;
  std::size_t i = 0;
  while (i < norm.size()) {
    const bool sp = norm[i] == ' ';
    std::size_t j = i;
    while (j < norm.size() && (norm[j] == ' ') == sp) ++j;
    chunks.push_back(Chunk{std::string_view(norm).substr(i, j - i), sp});
    i = j;
  }
  return chunks;
}

}

std::vector<std::string> wrap_text(std::string_view text, std::size_t width, char extra_space) {
  if (width == 0) width = 1;
  std::string norm;
  auto chunks = split_chunks(text, extra_space, norm);

  std::vector<std::string> lines;
  std::size_t next = 0;
  while (next < chunks.size()) {
    if (chunks[next].space) { ++next; continue; } // no line starts with blanks

    std::string cur;
    std::size_t cur_len = 0;
    bool last_space = false;
    while (next < chunks.size()) {
      const std::size_t len = utf8_length(chunks[next].text);
      if (cur_len + len > width) break;
      cur.append(chunks[next].text.data(), chunks[next].text.size());
      cur_len += len;
      last_space = chunks[next].space;
      ++next;
    }

    // a word that cannot fit on any line fills the rest of this one
    if (next < chunks.size() && !chunks[next].space && utf8_length(chunks[next].text) > width) {
      const std::size_t room = width - cur_len;
      if (room > 0) {
        std::string_view w = chunks[next].text;
        const std::size_t cut = utf8_prefix_bytes(w, room);
        cur.append(w.data(), cut);
        cur_len += room;
        chunks[next].text = w.substr(cut);
        last_space = false;
      }
    }

    if (last_space) {
      const std::size_t keep = cur.find_last_not_of(' ');
      cur.erase(keep == std::string::npos ? 0 : keep + 1);
    }
    if (!cur.empty()) lines.push_back(std::move(cur));
  }

  if (lines.empty()) lines.emplace_back();
  return lines;
}

}
