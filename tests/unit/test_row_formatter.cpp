#include "csv_reflow/row_formatter.hpp"
#include "csv_reflow/utf8.hpp"
#include <iostream>
#include <string>
#include <vector>

static std::vector<std::string> split(const std::string& s, char d) {
  std::vector<std::string> out(1);
  for (char c : s) { if (c == d) out.emplace_back(); else out.back().push_back(c); }
  return out;
}

int main(){
  // two short columns at the floor width
  {
    const std::vector<std::string> header{"name", "age"};
    cr::RecordBatch b; b.clear(&header);
    b.append({cr::Cell("Alice"), cr::Cell("30")}, 2);
    const cr::ColumnWidths widths{15, 15};

    cr::RowFormatter f('|');
    const std::string head = f.header_line(header, widths);
    if (head != "name           |age            ") { std::cerr << "[FAIL] header [" << head << "]\n"; return 1; }
    std::vector<std::string> lines;
    f.format(b.row(0), widths, lines);
    if (lines.size() != 1 || lines[0] != "Alice          |30             ") {
      std::cerr << "[FAIL] short row\n"; return 1;
    }
  }

  // a 50 character cell in a 20 wide column takes three lines
  {
    const std::vector<std::string> header{"id", "text", "tail"};
    const std::string fifty = std::string(20, 'a') + std::string(20, 'b') + std::string(10, 'c');
    cr::RecordBatch b; b.clear(&header);
    b.append({cr::Cell("7"), cr::Cell(fifty), cr::Cell("z")}, 2);
    const cr::ColumnWidths widths{15, 20, 15};

    cr::RowFormatter f('|');
    std::vector<std::string> lines;
    f.format(b.row(0), widths, lines);
    if (lines.size() != 3) { std::cerr << "[FAIL] wrapped row lines=" << lines.size() << "\n"; return 1; }
    if (lines[0] != "7" + std::string(14, ' ') + "|" + std::string(20, 'a') + "|z" + std::string(14, ' ') ||
        lines[1] != std::string(15, ' ') + " " + std::string(20, 'b') + " " + std::string(15, ' ') ||
        lines[2] != std::string(15, ' ') + " " + std::string(10, 'c') + std::string(10, ' ') + " " + std::string(15, ' ')) {
      std::cerr << "[FAIL] wrapped row text\n"; return 1;
    }
  }

  // nulls render empty; delimiter characters in the data are folded away
  {
    const std::vector<std::string> header{"a", "b|c", "d"};
    cr::RecordBatch b; b.clear(&header);
    b.append({std::nullopt, cr::Cell("x|y|z and a good deal of extra words to wrap"), cr::Cell("")}, 2);
    const cr::ColumnWidths widths{15, 15, 15};

    cr::RowFormatter f('|');
    if (split(f.header_line(header, widths), '|').size() != 3) { std::cerr << "[FAIL] header kept '|'\n"; return 1; }

    std::vector<std::string> lines;
    f.format(b.row(0), widths, lines);
    auto fields = split(lines.empty() ? std::string() : lines[0], '|');
    if (lines.size() < 2 || fields.size() != 3) { std::cerr << "[FAIL] folded row shape\n"; return 1; }
    for (std::size_t c = 0; c < fields.size(); ++c) {
      if (cr::utf8_length(fields[c]) != widths[c]) { std::cerr << "[FAIL] field " << c << " width\n"; return 1; }
    }
    if (fields[0] != std::string(15, ' ')) { std::cerr << "[FAIL] null not blank\n"; return 1; }
    for (std::size_t i = 1; i < lines.size(); ++i) {
      if (lines[i].find('|') != std::string::npos || cr::utf8_length(lines[i]) != 15u + 1 + 15 + 1 + 15) {
        std::cerr << "[FAIL] continuation [" << lines[i] << "]\n"; return 1;
      }
    }
  }

  // tab output: continuation lines carry no tabs either
  {
    const std::vector<std::string> header{"k", "v"};
    cr::RecordBatch b; b.clear(&header);
    b.append({cr::Cell("key"), cr::Cell("value\twith\ttabs and enough words to need a second line")}, 2);
    const cr::ColumnWidths widths{15, 20};
    cr::RowFormatter f('\t');
    std::vector<std::string> lines;
    f.format(b.row(0), widths, lines);
    if (lines.size() < 2 || split(lines[0], '\t').size() != 2) { std::cerr << "[FAIL] tab row\n"; return 1; }
    for (std::size_t i = 1; i < lines.size(); ++i) {
      if (lines[i].find('\t') != std::string::npos) { std::cerr << "[FAIL] tab in continuation\n"; return 1; }
    }
  }

  std::cout << "[PASS] row_formatter\n";
  return 0;
}
