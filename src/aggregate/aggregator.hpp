#pragma once

#include "aggregate/metrics_record.hpp"
#include "aggregate/run_layout.hpp"
#include "core/config/path_config.hpp"
#include "core/logging/logger.hpp"

#include <string>
#include <vector>

namespace benchtel::aggregate {

struct AggregateOptions {
  PhaseRegistry known_phases = DefaultPhaseRegistry();
  parsers::DurationFailurePolicy duration_policy = parsers::DurationFailurePolicy::kAbsent;
  parsers::ZeroRatePolicy zero_rate_policy = parsers::ZeroRatePolicy::kZeroSumIsAbsent;
  // Worker threads used for per-triple parsing; values below 1 mean 1.
  unsigned jobs = 1;
  bool include_sampled = false;
};

// Builds the record for one triple: tool report, then the dstat log, and the
// four sar reports only when every dstat average is absent.
MetricsRecord BuildRecord(const RunTriple& triple, const AggregateOptions& options,
                          core::logging::Logger* logger);

// Discovers and builds every record under `paths`, sorted by
// (framework, dataset, phase) with unique keys. Triples are independent and are
// spread over `options.jobs` threads; each writes only its own result slot.
bool CollectRecords(const core::config::PathConfig& paths, const AggregateOptions& options,
                    core::logging::Logger* logger, std::vector<MetricsRecord>& records,
                    std::string& error);

} // namespace benchtel::aggregate
