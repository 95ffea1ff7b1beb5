#include "parsers/csv_line.hpp"

#include "core/fs_utils.hpp"

namespace benchtel::parsers {

std::vector<std::string> SplitCsvLine(std::string_view line) {
  std::vector<std::string> cells;
  if (line.empty()) {
    return cells;
  }

  std::string cell;
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1U < line.size() && line[i + 1U] == '"') {
          cell.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        cell.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      cells.push_back(std::move(cell));
      cell.clear();
    } else {
      cell.push_back(c);
    }
  }
  cells.push_back(std::move(cell));
  return cells;
}

std::vector<std::vector<std::string>> ReadCsvRows(const std::filesystem::path& path) {
  std::vector<std::vector<std::string>> rows;
  for (const auto& line : core::ReadLinesIfPresent(path)) {
    rows.push_back(SplitCsvLine(line));
  }
  return rows;
}

} // namespace benchtel::parsers
