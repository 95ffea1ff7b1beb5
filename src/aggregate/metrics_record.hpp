#pragma once

#include "parsers/dstat_log.hpp"
#include "parsers/tool_report.hpp"

#include <array>
#include <string>
#include <tuple>

namespace benchtel::aggregate {

// Where a record's six averages came from.
enum class AveragesSource {
  kNone,
  kDstat,
  kSar,
  kTimeseries,
};

const char* ToString(AveragesSource source);

// One canonical row: a (framework, dataset, phase) triple joined with its tool
// report and run-duration averages. Every numeric field is optional; absence
// is never written as zero.
struct MetricsRecord {
  std::string framework;
  std::string dataset;
  std::string phase;
  parsers::ParsedToolMetrics tool;
  parsers::DstatAverages averages;
  AveragesSource averages_source = AveragesSource::kNone;
};

inline bool KeyLess(const MetricsRecord& lhs, const MetricsRecord& rhs) {
  return std::tie(lhs.framework, lhs.dataset, lhs.phase) <
         std::tie(rhs.framework, rhs.dataset, rhs.phase);
}

inline bool SameKey(const MetricsRecord& lhs, const MetricsRecord& rhs) {
  return lhs.framework == rhs.framework && lhs.dataset == rhs.dataset && lhs.phase == rhs.phase;
}

// Fixed column order of the canonical table.
inline constexpr std::array<const char*, 13> kSummaryColumns = {
    "framework",         "dataset",           "phase",           "elapsed_seconds",
    "max_rss_kb",        "cpu_user_s",        "cpu_sys_s",       "avg_cpu_util",
    "avg_mem_used_mb",   "avg_dsk_read_kbps", "avg_dsk_writ_kbps", "avg_net_recv_kbps",
    "avg_net_send_kbps",
};

} // namespace benchtel::aggregate
