#pragma once

#include "aggregate/metrics_record.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace benchtel::compare {

// One framework's phases for one dataset, rolled up. Totals are sums over the
// phases that carry a value, averages are means over those phases; a metric
// absent from every phase stays absent.
struct DatasetRollup {
  std::optional<double> elapsed_seconds;
  std::optional<double> max_rss_kb;
  std::optional<double> cpu_user_s;
  std::optional<double> cpu_sys_s;
  std::optional<double> avg_cpu_util;
  std::optional<double> avg_mem_used_mb;
  std::optional<double> avg_dsk_read_kbps;
  std::optional<double> avg_dsk_writ_kbps;
  std::optional<double> avg_net_recv_kbps;
  std::optional<double> avg_net_send_kbps;
  int phases = 0;
};

// Keyed by dataset. Rows of the `sampled` phase are left out of the rollup.
std::map<std::string, DatasetRollup> RollUpFramework(
    const std::vector<aggregate::MetricsRecord>& records, const std::string& framework);

enum class Verdict {
  kLeftFaster,
  kRightFaster,
  kTie,
  kUnknown,
};

Verdict CompareElapsed(const std::optional<double>& left, const std::optional<double>& right);

// Text report over datasets present for both frameworks, sorted by dataset.
std::string RenderComparison(const std::vector<aggregate::MetricsRecord>& records,
                             const std::string& left, const std::string& right);

} // namespace benchtel::compare
