#include "parsers/sar_report.hpp"

#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"

#include <map>
#include <string_view>
#include <utility>

namespace benchtel::parsers {

namespace {

constexpr std::string_view kAverageLabel = "Average:";
constexpr std::string_view kBannerPrefix = "Linux";
constexpr std::string_view kLoopback = "lo";

bool IsAverageRow(std::string_view line) {
  return core::StartsWith(line, kAverageLabel);
}

// Column-header lines carry '%' labels; the banner names the kernel.
bool IsDataRow(std::string_view line) {
  return line.find('%') == std::string_view::npos && !core::Trim(line).empty() &&
         !core::StartsWith(line, kBannerPrefix) && !IsAverageRow(line);
}

// Only the last Average row is considered; nullptr when there is none.
const std::string* FindLastAverageRow(const std::vector<std::string>& lines) {
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    if (IsAverageRow(*it)) {
      return &*it;
    }
  }
  return nullptr;
}

std::optional<double> Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return std::nullopt;
  }
  double sum = 0.0;
  for (const double value : values) {
    sum += value;
  }
  return sum / static_cast<double>(values.size());
}

} // namespace

std::optional<double> ParseSarCpu(const std::vector<std::string>& lines) {
  if (lines.empty()) {
    return std::nullopt;
  }

  // Average: all %user %nice %system %iowait %steal %idle
  if (const std::string* average = FindLastAverageRow(lines); average != nullptr) {
    const auto parts = core::SplitWhitespace(*average);
    if (parts.size() >= 8U) {
      if (const auto idle = core::ParseDouble(parts.back()); idle.has_value()) {
        return 100.0 - *idle;
      }
    }
  }

  std::vector<double> values;
  for (const auto& line : lines) {
    if (!IsDataRow(line)) {
      continue;
    }
    const auto parts = core::SplitWhitespace(line);
    if (parts.size() < 8U) {
      continue;
    }
    if (const auto idle = core::ParseDouble(parts.back()); idle.has_value()) {
      values.push_back(100.0 - *idle);
    }
  }
  return Mean(values);
}

std::optional<double> ParseSarMemory(const std::vector<std::string>& lines) {
  if (lines.empty()) {
    return std::nullopt;
  }

  // Average: kbmemfree kbavail kbmemused ...
  if (const std::string* average = FindLastAverageRow(lines); average != nullptr) {
    const auto parts = core::SplitWhitespace(*average);
    if (parts.size() >= 4U) {
      if (const auto used_kb = core::ParseDouble(parts[3]); used_kb.has_value()) {
        return *used_kb / 1024.0;
      }
    }
  }

  std::vector<double> values;
  for (const auto& line : lines) {
    if (!IsDataRow(line)) {
      continue;
    }
    const auto parts = core::SplitWhitespace(line);
    if (parts.size() < 4U) {
      continue;
    }
    if (const auto used_kb = core::ParseDouble(parts[3]); used_kb.has_value()) {
      values.push_back(*used_kb / 1024.0);
    }
  }
  return Mean(values);
}

SarRatePair ParseSarDisk(const std::vector<std::string>& lines) {
  if (lines.empty()) {
    return {};
  }

  // Average: tps rtps wtps bread/s bwrtn/s
  if (const std::string* average = FindLastAverageRow(lines); average != nullptr) {
    const auto parts = core::SplitWhitespace(*average);
    if (parts.size() >= 6U) {
      const auto read = core::ParseDouble(parts[parts.size() - 2U]);
      const auto write = core::ParseDouble(parts.back());
      if (read.has_value() && write.has_value()) {
        return {read, write};
      }
    }
  }

  std::vector<double> reads;
  std::vector<double> writes;
  for (const auto& line : lines) {
    if (!IsDataRow(line)) {
      continue;
    }
    const auto parts = core::SplitWhitespace(line);
    if (parts.size() < 6U) {
      continue;
    }
    const auto read = core::ParseDouble(parts[parts.size() - 2U]);
    const auto write = core::ParseDouble(parts.back());
    if (!read.has_value() || !write.has_value()) {
      continue;
    }
    reads.push_back(*read);
    writes.push_back(*write);
  }
  return {Mean(reads), Mean(writes)};
}

SarRatePair ParseSarNetwork(const std::vector<std::string>& lines) {
  if (lines.empty()) {
    return {};
  }

  // Average: IFACE rxpck/s txpck/s rxkB/s txkB/s ...
  double total_rx = 0.0;
  double total_tx = 0.0;
  bool any_interface = false;
  for (const auto& line : lines) {
    if (!IsAverageRow(line)) {
      continue;
    }
    const auto parts = core::SplitWhitespace(line);
    if (parts.size() < 6U) {
      continue;
    }
    const std::string_view iface = parts[1];
    if (core::ToLower(iface) == "iface" || iface == kLoopback) {
      continue;
    }
    const auto rx = core::ParseDouble(parts[4]);
    const auto tx = core::ParseDouble(parts[5]);
    if (!rx.has_value() || !tx.has_value()) {
      continue;
    }
    total_rx += *rx;
    total_tx += *tx;
    any_interface = true;
  }
  if (any_interface) {
    return {total_rx, total_tx};
  }

  // 12:00:01 eth0 0.00 0.01 0.00 0.00 ...
  std::map<std::string, std::pair<double, double>> per_timestamp;
  for (const auto& line : lines) {
    if (line.find("IFACE") != std::string::npos || core::Trim(line).empty() ||
        core::StartsWith(line, kBannerPrefix) || IsAverageRow(line)) {
      continue;
    }
    const auto parts = core::SplitWhitespace(line);
    if (parts.size() < 6U || parts[1] == kLoopback) {
      continue;
    }
    const auto rx = core::ParseDouble(parts[4]);
    const auto tx = core::ParseDouble(parts[5]);
    if (!rx.has_value() || !tx.has_value()) {
      continue;
    }
    auto& totals = per_timestamp[std::string(parts[0])];
    totals.first += *rx;
    totals.second += *tx;
  }
  if (per_timestamp.empty()) {
    return {};
  }

  double sum_rx = 0.0;
  double sum_tx = 0.0;
  for (const auto& entry : per_timestamp) {
    sum_rx += entry.second.first;
    sum_tx += entry.second.second;
  }
  const auto count = static_cast<double>(per_timestamp.size());
  return {sum_rx / count, sum_tx / count};
}

DstatAverages ReadSarReports(const SarReportPaths& paths) {
  DstatAverages averages;
  averages.avg_cpu_util = ParseSarCpu(core::ReadLinesIfPresent(paths.cpu));
  averages.avg_mem_used_mb = ParseSarMemory(core::ReadLinesIfPresent(paths.memory));

  const SarRatePair disk = ParseSarDisk(core::ReadLinesIfPresent(paths.disk));
  averages.avg_dsk_read_kbps = disk.first;
  averages.avg_dsk_writ_kbps = disk.second;

  const SarRatePair network = ParseSarNetwork(core::ReadLinesIfPresent(paths.network));
  averages.avg_net_recv_kbps = network.first;
  averages.avg_net_send_kbps = network.second;
  return averages;
}

} // namespace benchtel::parsers
