#include "compare/perf_compare.hpp"

#include "aggregate/sampled_run_reader.hpp"
#include "core/text_utils.hpp"

#include <cstdint>

namespace benchtel::compare {

namespace {

class Accumulator {
public:
  void Add(const std::optional<double>& value) {
    if (value.has_value()) {
      sum_ += *value;
      ++count_;
    }
  }

  std::optional<double> Sum() const {
    return count_ > 0 ? std::optional<double>(sum_) : std::nullopt;
  }

  std::optional<double> Mean() const {
    return count_ > 0 ? std::optional<double>(sum_ / count_) : std::nullopt;
  }

private:
  double sum_ = 0.0;
  int count_ = 0;
};

struct RollupAccumulators {
  Accumulator elapsed, rss, user, sys, cpu, mem, dsk_read, dsk_writ, net_recv, net_send;
  int phases = 0;
};

std::optional<double> ToDouble(const std::optional<std::int64_t>& value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return static_cast<double>(*value);
}

std::string Fixed(const std::optional<double>& value, int precision) {
  return value.has_value() ? core::FormatFixedDouble(*value, precision) : "n/a";
}

std::string SignedFixed(double value) {
  const std::string text = core::FormatFixedDouble(value, 2);
  return value >= 0.0 ? "+" + text : text;
}

std::string VerdictText(Verdict verdict, const std::string& left, const std::string& right) {
  switch (verdict) {
  case Verdict::kLeftFaster:
    return left + " faster";
  case Verdict::kRightFaster:
    return right + " faster";
  case Verdict::kTie:
    return "tie";
  case Verdict::kUnknown:
    return "unknown";
  }
  return "unknown";
}

} // namespace

std::map<std::string, DatasetRollup> RollUpFramework(
    const std::vector<aggregate::MetricsRecord>& records, const std::string& framework) {
  std::map<std::string, RollupAccumulators> accumulators;
  for (const auto& record : records) {
    // A sampled run re-measures the whole job; it is not one of its phases.
    if (record.framework != framework || record.phase == aggregate::kSampledPhase) {
      continue;
    }
    RollupAccumulators& acc = accumulators[record.dataset];
    ++acc.phases;
    acc.elapsed.Add(record.tool.elapsed_seconds);
    acc.rss.Add(ToDouble(record.tool.max_rss_kb));
    acc.user.Add(record.tool.user_cpu_seconds);
    acc.sys.Add(record.tool.system_cpu_seconds);
    acc.cpu.Add(record.averages.avg_cpu_util);
    acc.mem.Add(record.averages.avg_mem_used_mb);
    acc.dsk_read.Add(record.averages.avg_dsk_read_kbps);
    acc.dsk_writ.Add(record.averages.avg_dsk_writ_kbps);
    acc.net_recv.Add(record.averages.avg_net_recv_kbps);
    acc.net_send.Add(record.averages.avg_net_send_kbps);
  }

  std::map<std::string, DatasetRollup> rollups;
  for (const auto& [dataset, acc] : accumulators) {
    DatasetRollup& rollup = rollups[dataset];
    rollup.phases = acc.phases;
    rollup.elapsed_seconds = acc.elapsed.Sum();
    rollup.max_rss_kb = acc.rss.Sum();
    rollup.cpu_user_s = acc.user.Sum();
    rollup.cpu_sys_s = acc.sys.Sum();
    rollup.avg_cpu_util = acc.cpu.Mean();
    rollup.avg_mem_used_mb = acc.mem.Mean();
    rollup.avg_dsk_read_kbps = acc.dsk_read.Mean();
    rollup.avg_dsk_writ_kbps = acc.dsk_writ.Mean();
    rollup.avg_net_recv_kbps = acc.net_recv.Mean();
    rollup.avg_net_send_kbps = acc.net_send.Mean();
  }
  return rollups;
}

Verdict CompareElapsed(const std::optional<double>& left, const std::optional<double>& right) {
  if (!left.has_value() || !right.has_value()) {
    return Verdict::kUnknown;
  }
  if (*left < *right) {
    return Verdict::kLeftFaster;
  }
  if (*right < *left) {
    return Verdict::kRightFaster;
  }
  return Verdict::kTie;
}

std::string RenderComparison(const std::vector<aggregate::MetricsRecord>& records,
                             const std::string& left, const std::string& right) {
  const auto left_rollups = RollUpFramework(records, left);
  const auto right_rollups = RollUpFramework(records, right);

  std::string out = "Performance comparison (" + left + " vs " + right + ")\n";
  int compared = 0;
  for (const auto& [dataset, l] : left_rollups) {
    const auto match = right_rollups.find(dataset);
    if (match == right_rollups.end()) {
      continue;
    }
    const DatasetRollup& r = match->second;
    ++compared;

    const Verdict verdict = CompareElapsed(l.elapsed_seconds, r.elapsed_seconds);
    std::string diff = "n/a";
    if (l.elapsed_seconds.has_value() && r.elapsed_seconds.has_value()) {
      diff = SignedFixed(*r.elapsed_seconds - *l.elapsed_seconds) + "s";
    }

    out += "\n- " + dataset + ":\n";
    out += "    elapsed: " + left + " " + Fixed(l.elapsed_seconds, 2) + "s vs " + right + " " +
           Fixed(r.elapsed_seconds, 2) + "s -> " + VerdictText(verdict, left, right) +
           " (diff " + diff + ")\n";
    out += "    max RSS (sum over phases): " + left + " " + Fixed(l.max_rss_kb, 0) + " KB; " +
           right + " " + Fixed(r.max_rss_kb, 0) + " KB\n";
    out += "    avg CPU util: " + left + " " + Fixed(l.avg_cpu_util, 2) + "%; " + right + " " +
           Fixed(r.avg_cpu_util, 2) + "%\n";
    out += "    avg mem used (MB): " + left + " " + Fixed(l.avg_mem_used_mb, 2) + "; " + right +
           " " + Fixed(r.avg_mem_used_mb, 2) + "\n";
    out += "    avg disk r/w (kB/s): " + left + " " + Fixed(l.avg_dsk_read_kbps, 2) + "/" +
           Fixed(l.avg_dsk_writ_kbps, 2) + "; " + right + " " + Fixed(r.avg_dsk_read_kbps, 2) +
           "/" + Fixed(r.avg_dsk_writ_kbps, 2) + "\n";
    out += "    avg net rx/tx (kB/s): " + left + " " + Fixed(l.avg_net_recv_kbps, 2) + "/" +
           Fixed(l.avg_net_send_kbps, 2) + "; " + right + " " + Fixed(r.avg_net_recv_kbps, 2) +
           "/" + Fixed(r.avg_net_send_kbps, 2) + "\n";
  }
  if (compared == 0) {
    out += "\nno dataset has rows for both " + left + " and " + right + "\n";
  }
  return out;
}

} // namespace benchtel::compare
