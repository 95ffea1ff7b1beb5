#include "aggregate/sampled_run_reader.hpp"

#include "aggregate/run_layout.hpp"
#include "artifacts/run_summary_json.hpp"
#include "artifacts/timeseries_writer.hpp"
#include "core/text_utils.hpp"
#include "parsers/csv_line.hpp"

namespace fs = std::filesystem;

namespace benchtel::aggregate {

namespace {

constexpr double kBytesPerKiB = 1024.0;

std::optional<std::size_t> FindColumn(const std::vector<std::string>& header,
                                      std::string_view name) {
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (core::Trim(header[i]) == name) {
      return i;
    }
  }
  return std::nullopt;
}

struct RunningMean {
  double sum = 0.0;
  std::uint64_t count = 0;

  void Add(const std::vector<std::string>& row, const std::optional<std::size_t>& column) {
    if (!column.has_value() || *column >= row.size()) {
      return;
    }
    if (const auto value = core::ParseDouble(row[*column])) {
      sum += *value;
      ++count;
    }
  }

  std::optional<double> Mean() const {
    if (count == 0U) {
      return std::nullopt;
    }
    return sum / static_cast<double>(count);
  }
};

std::optional<double> RateKbps(std::int64_t delta_bytes, double elapsed_seconds) {
  if (!(elapsed_seconds > 0.0)) {
    return std::nullopt;
  }
  return static_cast<double>(delta_bytes) / kBytesPerKiB / elapsed_seconds;
}

} // namespace

bool DiscoverSampledRuns(const fs::path& sampled_root, std::vector<SampledRun>& runs,
                         std::string& error) {
  runs.clear();
  std::vector<std::string> systems;
  if (!ListSubdirectories(sampled_root, systems, error)) {
    return false;
  }
  for (const auto& system : systems) {
    std::vector<std::string> datasets;
    if (!ListSubdirectories(sampled_root / system, datasets, error)) {
      return false;
    }
    for (const auto& dataset : datasets) {
      runs.push_back(SampledRun{system, dataset, sampled_root / system / dataset});
    }
  }
  return true;
}

TimeseriesMeans ReadTimeseriesMeans(const fs::path& path) {
  TimeseriesMeans means;
  const auto rows = parsers::ReadCsvRows(path);
  if (rows.empty()) {
    return means;
  }

  const auto cpu_column = FindColumn(rows.front(), "cpu_percent");
  const auto mem_column = FindColumn(rows.front(), "mem_used_mb");
  RunningMean cpu;
  RunningMean mem;
  for (std::size_t i = 1; i < rows.size(); ++i) {
    if (rows[i].empty()) {
      continue;
    }
    ++means.rows;
    cpu.Add(rows[i], cpu_column);
    mem.Add(rows[i], mem_column);
  }
  means.cpu_percent = cpu.Mean();
  means.mem_used_mb = mem.Mean();
  return means;
}

bool BuildSampledRecord(const SampledRun& run, MetricsRecord& record, std::string& error) {
  sampler::RunSummary summary;
  if (!artifacts::LoadRunSummaryJson(run.dir / artifacts::kRunSummaryFileName, summary, error)) {
    return false;
  }

  record = MetricsRecord{};
  record.framework = run.system;
  record.dataset = run.dataset;
  record.phase = kSampledPhase;
  record.tool.elapsed_seconds = summary.elapsed_sec;

  const TimeseriesMeans means = ReadTimeseriesMeans(run.dir / artifacts::kTimeseriesFileName);
  record.averages.avg_cpu_util = means.cpu_percent;
  record.averages.avg_mem_used_mb = means.mem_used_mb;
  record.averages.avg_dsk_read_kbps = RateKbps(summary.disk_read_delta_bytes, summary.elapsed_sec);
  record.averages.avg_dsk_writ_kbps =
      RateKbps(summary.disk_write_delta_bytes, summary.elapsed_sec);
  record.averages.avg_net_recv_kbps = RateKbps(summary.net_recv_delta_bytes, summary.elapsed_sec);
  record.averages.avg_net_send_kbps = RateKbps(summary.net_sent_delta_bytes, summary.elapsed_sec);
  record.averages_source = AveragesSource::kTimeseries;
  return true;
}

} // namespace benchtel::aggregate
