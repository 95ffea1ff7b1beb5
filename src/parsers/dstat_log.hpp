#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace benchtel::parsers {

// Run-duration averages of host activity. Each field is absent when its source
// could not be located or contributed no samples.
struct DstatAverages {
  std::optional<double> avg_cpu_util;
  std::optional<double> avg_mem_used_mb;
  std::optional<double> avg_dsk_read_kbps;
  std::optional<double> avg_dsk_writ_kbps;
  std::optional<double> avg_net_recv_kbps;
  std::optional<double> avg_net_send_kbps;

  bool AllAbsent() const {
    return !avg_cpu_util.has_value() && !avg_mem_used_mb.has_value() &&
           !avg_dsk_read_kbps.has_value() && !avg_dsk_writ_kbps.has_value() &&
           !avg_net_recv_kbps.has_value() && !avg_net_send_kbps.has_value();
  }
};

// How a disk/network column whose samples sum to exactly zero is reported.
enum class ZeroRatePolicy {
  // A zero sum is indistinguishable from a missing column and is reported
  // absent.
  kZeroSumIsAbsent,
  // A resolved column that contributed at least one cell is reported, zero
  // included.
  kReportResolvedColumns,
};

// Column indices resolved from one header row. Unresolved columns stay empty.
struct DstatColumnMap {
  std::optional<std::size_t> cpu_usr;
  std::optional<std::size_t> cpu_sys;
  std::optional<std::size_t> cpu_idl;
  std::optional<std::size_t> mem_used;
  std::optional<std::size_t> dsk_read;
  std::optional<std::size_t> dsk_writ;
  std::optional<std::size_t> net_recv;
  std::optional<std::size_t> net_send;
};

// A header row is one whose first cell, trimmed, equals "time" ignoring case.
bool IsDstatHeaderRow(const std::vector<std::string>& row);

// Fuzzy label resolution: the first header cell (left to right) whose trimmed,
// lower-cased label contains any of a column's candidate substrings.
DstatColumnMap ResolveDstatColumns(const std::vector<std::string>& header);

struct DstatReadResult {
  DstatAverages averages;
  std::uint64_t samples = 0;
  std::uint32_t header_blocks = 0;
  // Header blocks that were followed by at least one qualifying data row.
  std::uint32_t contributing_blocks = 0;
};

// Aggregates data rows across every header block into one set of running sums.
// Rows before the first header and rows narrower than the active header are
// skipped; unparsable cells are skipped individually while the row still
// counts as a sample. Memory sums are bytes and are reported in MiB.
DstatReadResult ParseDstatRows(const std::vector<std::vector<std::string>>& rows,
                               ZeroRatePolicy zero_rate_policy);

// Missing file -> all-absent result with zero samples.
DstatReadResult ReadDstatLog(const std::filesystem::path& path, ZeroRatePolicy zero_rate_policy);

} // namespace benchtel::parsers
