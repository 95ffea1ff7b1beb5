#pragma once

#include "aggregate/metrics_record.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace benchtel::aggregate {

inline constexpr const char* kSampledPhase = "sampled";

struct SampledRun {
  std::string system;
  std::string dataset;
  std::filesystem::path dir;
};

// Every <sampled_root>/<system>/<dataset>/ directory, sorted. Missing root ->
// no runs.
bool DiscoverSampledRuns(const std::filesystem::path& sampled_root, std::vector<SampledRun>& runs,
                         std::string& error);

struct TimeseriesMeans {
  std::optional<double> cpu_percent;
  std::optional<double> mem_used_mb;
  std::uint64_t rows = 0;
};

// Column means of a sampler timeseries.csv, located by header name. Cells that
// fail to parse are skipped individually.
TimeseriesMeans ReadTimeseriesMeans(const std::filesystem::path& path);

// One `sampled` record from summary.json plus timeseries.csv:
// - elapsed_seconds from the summary
// - avg_cpu_util and avg_mem_used_mb from the timeseries means
// - disk/network KB/s as byte delta / 1024 / elapsed (absent unless elapsed > 0)
// Tool-report fields stay absent. Fails when summary.json cannot be read.
bool BuildSampledRecord(const SampledRun& run, MetricsRecord& record, std::string& error);

} // namespace benchtel::aggregate
