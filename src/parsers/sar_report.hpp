#pragma once

#include "parsers/dstat_log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace benchtel::parsers {

// Historical-activity (sar) text reports, read only when the columnar log gave
// nothing. Every reader prefers the tool's own "Average:" summary row and falls
// back to averaging the data rows; a row that fails to parse is skipped.

struct SarRatePair {
  std::optional<double> first;
  std::optional<double> second;
};

// `sar -u`: CPU utilization = 100 - %idle (last column).
std::optional<double> ParseSarCpu(const std::vector<std::string>& lines);

// `sar -r`: used memory in MB from the kbmemused column (index 3).
std::optional<double> ParseSarMemory(const std::vector<std::string>& lines);

// `sar -b`: read/write throughput from the last two columns.
SarRatePair ParseSarDisk(const std::vector<std::string>& lines);

// `sar -n DEV`: receive/send KB/s (columns 4 and 5) summed over every
// interface except loopback. Average rows are summed directly; otherwise data
// rows are summed per timestamp and averaged across timestamps.
SarRatePair ParseSarNetwork(const std::vector<std::string>& lines);

// Locations of the four report variants for one (framework, dataset, phase).
struct SarReportPaths {
  std::filesystem::path cpu;
  std::filesystem::path memory;
  std::filesystem::path disk;
  std::filesystem::path network;
};

// Reads all four variants; missing files leave their fields absent.
DstatAverages ReadSarReports(const SarReportPaths& paths);

} // namespace benchtel::parsers
