#include "aggregate/aggregator.hpp"

#include "aggregate/sampled_run_reader.hpp"
#include "parsers/sar_report.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace benchtel::aggregate {

namespace {

using core::logging::LogLevel;

std::string TripleScope(const std::string& framework, const std::string& dataset,
                        const std::string& phase) {
  return framework + "/" + dataset + "/" + phase;
}

void LogScopedIfPresent(core::logging::Logger* logger, LogLevel level, std::string_view scope,
                        std::string_view message,
                        std::initializer_list<core::logging::LogFieldView> fields) {
  if (logger != nullptr) {
    logger->LogScoped(level, scope, message, fields);
  }
}

void BuildRecordsInParallel(const std::vector<RunTriple>& triples, const AggregateOptions& options,
                            core::logging::Logger* logger, std::vector<MetricsRecord>& slots) {
  slots.assign(triples.size(), MetricsRecord{});
  const std::size_t worker_count =
      std::min<std::size_t>(std::max(1U, options.jobs), std::max<std::size_t>(1U, triples.size()));

  std::atomic<std::size_t> next{0};
  const auto work = [&]() {
    for (std::size_t i = next.fetch_add(1U); i < triples.size(); i = next.fetch_add(1U)) {
      slots[i] = BuildRecord(triples[i], options, logger);
    }
  };

  if (worker_count == 1U) {
    work();
    return;
  }

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(work);
  }
  for (auto& worker : workers) {
    worker.join();
  }
}

} // namespace

MetricsRecord BuildRecord(const RunTriple& triple, const AggregateOptions& options,
                          core::logging::Logger* logger) {
  const std::string scope = TripleScope(triple.framework, triple.dataset, triple.phase);
  const PhaseArtifacts artifacts = PhaseArtifactsFor(triple.dataset_dir, triple.phase);

  MetricsRecord record;
  record.framework = triple.framework;
  record.dataset = triple.dataset;
  record.phase = triple.phase;
  record.tool = parsers::ReadToolReport(artifacts.time_report, options.duration_policy);

  const parsers::DstatReadResult dstat =
      parsers::ReadDstatLog(artifacts.dstat_csv, options.zero_rate_policy);
  if (dstat.contributing_blocks > 1U) {
    LogScopedIfPresent(logger, LogLevel::kWarn, scope,
                       "dstat log spans several header blocks; averages run across all of them",
                       {{"path", artifacts.dstat_csv.string()},
                        {"header_blocks", std::to_string(dstat.header_blocks)},
                        {"contributing_blocks", std::to_string(dstat.contributing_blocks)}});
  }

  if (!dstat.averages.AllAbsent()) {
    record.averages = dstat.averages;
    record.averages_source = AveragesSource::kDstat;
  } else {
    record.averages = parsers::ReadSarReports(artifacts.sar);
    if (!record.averages.AllAbsent()) {
      record.averages_source = AveragesSource::kSar;
      LogScopedIfPresent(logger, LogLevel::kInfo, scope,
                         "dstat averages unavailable; using sar reports", {});
    }
  }

  LogScopedIfPresent(logger, LogLevel::kDebug, scope, "record built",
                     {{"averages_source", ToString(record.averages_source)},
                      {"dstat_samples", std::to_string(dstat.samples)},
                      {"elapsed_present", record.tool.elapsed_seconds ? "true" : "false"}});
  return record;
}

bool CollectRecords(const core::config::PathConfig& paths, const AggregateOptions& options,
                    core::logging::Logger* logger, std::vector<MetricsRecord>& records,
                    std::string& error) {
  records.clear();

  std::vector<RunTriple> triples;
  if (!DiscoverRunTriples(paths.metrics_root, options.known_phases, triples, error)) {
    return false;
  }
  if (logger != nullptr) {
    logger->Info("run triples discovered", {{"metrics_root", paths.metrics_root.string()},
                                            {"triples", std::to_string(triples.size())},
                                            {"jobs", std::to_string(std::max(1U, options.jobs))}});
  }
  BuildRecordsInParallel(triples, options, logger, records);

  if (options.include_sampled) {
    std::vector<SampledRun> runs;
    if (!DiscoverSampledRuns(paths.sampled_root, runs, error)) {
      return false;
    }
    for (const auto& run : runs) {
      MetricsRecord record;
      std::string run_error;
      if (!BuildSampledRecord(run, record, run_error)) {
        LogScopedIfPresent(logger, LogLevel::kWarn, run.system + "/" + run.dataset,
                           "skipping sampled run without a readable summary",
                           {{"error", run_error}});
        continue;
      }
      records.push_back(std::move(record));
    }
  }

  std::stable_sort(records.begin(), records.end(), KeyLess);
  const auto duplicate = std::adjacent_find(records.begin(), records.end(), SameKey);
  if (duplicate != records.end()) {
    LogScopedIfPresent(logger, LogLevel::kWarn,
                       TripleScope(duplicate->framework, duplicate->dataset, duplicate->phase),
                       "duplicate record key; keeping the tool-report record", {});
    records.erase(std::unique(records.begin(), records.end(), SameKey), records.end());
  }
  return true;
}

} // namespace benchtel::aggregate
