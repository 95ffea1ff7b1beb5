#include "sampler/supervisor.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "artifacts/run_summary_json.hpp"
#include "artifacts/timeseries_writer.hpp"
#include "core/text_utils.hpp"
#include "core/time_utils.hpp"
#include "sampler/child_process.hpp"
#include "sampler/host_sampler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace fs = std::filesystem;

namespace benchtel::sampler {

namespace {

std::int64_t NonNegativeDelta(std::uint64_t end, std::uint64_t start) {
  if (end <= start) {
    return 0;
  }
  return static_cast<std::int64_t>(end - start);
}

void LogIfPresent(core::logging::Logger* logger, core::logging::LogLevel level,
                  std::string_view message, std::initializer_list<core::logging::LogFieldView> fields) {
  if (logger != nullptr) {
    logger->Log(level, message, fields);
  }
}

} // namespace

double EffectiveInterval(double requested_seconds) {
  if (!std::isfinite(requested_seconds)) {
    return kDefaultIntervalSeconds;
  }
  return std::clamp(requested_seconds, kMinIntervalSeconds, kMaxIntervalSeconds);
}

fs::path RunOutputDir(const SamplerOptions& options) {
  return options.out_root / options.system / options.dataset;
}

bool SuperviseCommand(const SamplerOptions& options, hostprobe::HostCounterSource& source,
                      core::logging::Logger* logger, SupervisionResult& result,
                      std::string& error) {
  using core::logging::LogLevel;

  result = SupervisionResult{};
  if (options.command.empty()) {
    result.failure = SupervisionFailure::kInvalidOptions;
    error = "no command to supervise";
    return false;
  }
  if (options.system.empty() || options.dataset.empty()) {
    result.failure = SupervisionFailure::kInvalidOptions;
    error = "system and dataset labels are required";
    return false;
  }

  const double interval = EffectiveInterval(options.interval_seconds);
  const auto interval_duration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(interval));

  HostSampler sampler(source, logger);
  const HostSampler::IoCounters baseline = sampler.ReadIoCounters();

  const auto start_wall = std::chrono::steady_clock::now();
  const double start_epoch = core::ToEpochSeconds(std::chrono::system_clock::now());

  ChildProcess child;
  LaunchSpec spec;
  spec.argv = options.command;
  if (!child.Launch(spec, error)) {
    result.failure = SupervisionFailure::kLaunchFailed;
    LogIfPresent(logger, LogLevel::kError, "failed to launch supervised command",
                 {{"command", options.command.front()}, {"error", error}});
    return false;
  }
  LogIfPresent(logger, LogLevel::kInfo, "supervised command started",
               {{"pid", std::to_string(child.Pid())},
                {"command", options.command.front()},
                {"interval_sec", core::FormatShortestDouble(interval)}});

  // The output directory is only created once the command is known to run, so
  // a launch failure leaves nothing behind.
  result.output_dir = RunOutputDir(options);
  artifacts::TimeseriesCsvWriter timeseries;
  if (!artifacts::EnsureOutputDir(result.output_dir, error) ||
      !timeseries.Open(result.output_dir / artifacts::kTimeseriesFileName, error)) {
    result.failure = SupervisionFailure::kOutputFailed;
    LogIfPresent(logger, LogLevel::kError, "failed to open timeseries output",
                 {{"output_dir", result.output_dir.string()}, {"error", error}});
    // ChildProcess kills and reaps the command on scope exit.
    return false;
  }
  result.timeseries_path = timeseries.Path();

  RunSummary& summary = result.summary;
  summary.system = options.system;
  summary.dataset = options.dataset;
  summary.cmd = options.command;
  summary.start_epoch = start_epoch;

  std::string write_error;
  while (true) {
    bool running = false;
    if (!child.Poll(running, error)) {
      result.failure = SupervisionFailure::kWaitFailed;
      LogIfPresent(logger, LogLevel::kError, "failed to poll supervised command",
                   {{"error", error}});
      return false;
    }

    const Sample sample =
        sampler.Take(core::SecondsBetween(start_wall, std::chrono::steady_clock::now()));
    summary.peak_cpu_percent = std::max(summary.peak_cpu_percent, sample.cpu_percent);
    summary.max_mem_used_mb = std::max(summary.max_mem_used_mb, sample.mem_used_mb);
    ++summary.samples;
    if (write_error.empty() && !timeseries.Append(sample, write_error)) {
      LogIfPresent(logger, LogLevel::kError, "timeseries write failed; sampling continues",
                   {{"path", result.timeseries_path.string()}, {"error", write_error}});
    }

    if (!running) {
      break;
    }
    std::this_thread::sleep_for(interval_duration);
  }

  const auto end_wall = std::chrono::steady_clock::now();
  summary.end_epoch = core::ToEpochSeconds(std::chrono::system_clock::now());
  summary.elapsed_sec = core::SecondsBetween(start_wall, end_wall);
  result.child_exit_code = child.ExitCode();

  const HostSampler::IoCounters end = sampler.ReadIoCounters();
  summary.disk_read_delta_bytes = NonNegativeDelta(end.disk.read_bytes, baseline.disk.read_bytes);
  summary.disk_write_delta_bytes =
      NonNegativeDelta(end.disk.write_bytes, baseline.disk.write_bytes);
  summary.net_sent_delta_bytes = NonNegativeDelta(end.net.sent_bytes, baseline.net.sent_bytes);
  summary.net_recv_delta_bytes = NonNegativeDelta(end.net.recv_bytes, baseline.net.recv_bytes);

  std::string close_error;
  if (!timeseries.Close(close_error) && write_error.empty()) {
    write_error = close_error;
  }
  if (!write_error.empty()) {
    result.failure = SupervisionFailure::kOutputFailed;
    error = write_error;
    return false;
  }

  if (!artifacts::WriteRunSummaryJson(summary, result.output_dir, result.summary_path, error)) {
    result.failure = SupervisionFailure::kOutputFailed;
    LogIfPresent(logger, LogLevel::kError, "failed to write run summary",
                 {{"output_dir", result.output_dir.string()}, {"error", error}});
    return false;
  }

  LogIfPresent(logger, LogLevel::kInfo, "supervised command finished",
               {{"exit_code", std::to_string(result.child_exit_code)},
                {"elapsed_sec", core::FormatFixedDouble(summary.elapsed_sec, 3)},
                {"samples", std::to_string(summary.samples)},
                {"summary", result.summary_path.string()}});
  return true;
}

} // namespace benchtel::sampler
