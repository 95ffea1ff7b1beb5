#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace benchtel::parsers {

// Splits one CSV line into cells: ',' delimiter, '"' quoting with "" as an
// escaped quote. Quotes are removed from cell text; an unterminated quote runs
// to end of line. An empty line yields no cells.
std::vector<std::string> SplitCsvLine(std::string_view line);

// Reads every line of a CSV file. Missing file -> no rows.
std::vector<std::vector<std::string>> ReadCsvRows(const std::filesystem::path& path);

} // namespace benchtel::parsers
