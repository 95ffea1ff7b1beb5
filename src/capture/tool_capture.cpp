#include "capture/tool_capture.hpp"

#include "aggregate/run_layout.hpp"
#include "artifacts/output_dir_utils.hpp"
#include "capture/time_report.hpp"
#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"
#include "core/time_utils.hpp"
#include "sampler/child_process.hpp"

#include <chrono>
#include <csignal>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace benchtel::capture {

namespace {

using core::logging::LogLevel;
using sampler::ChildProcess;
using sampler::LaunchSpec;

constexpr auto kHelperStopTimeout = std::chrono::seconds(5);
constexpr auto kHelperStopPoll = std::chrono::milliseconds(50);

struct Helper {
  std::string name;
  ChildProcess process;
};

void LogIfPresent(core::logging::Logger* logger, LogLevel level, std::string_view message,
                  std::initializer_list<core::logging::LogFieldView> fields) {
  if (logger != nullptr) {
    logger->Log(level, message, fields);
  }
}

void SleepSeconds(double seconds) {
  if (seconds > 0.0) {
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
  }
}

void StartHelper(std::string name, const LaunchSpec& spec, std::vector<Helper>& helpers,
                 core::logging::Logger* logger) {
  Helper helper;
  helper.name = std::move(name);
  std::string error;
  if (!helper.process.Launch(spec, error)) {
    LogIfPresent(logger, LogLevel::kWarn, "monitor failed to start; continuing without it",
                 {{"monitor", helper.name}, {"error", error}});
    return;
  }
  LogIfPresent(logger, LogLevel::kDebug, "monitor started",
               {{"monitor", helper.name}, {"pid", std::to_string(helper.process.Pid())}});
  helpers.push_back(std::move(helper));
}

// SIGINT lets dstat and sar flush their output; a monitor that ignores it is
// killed after a bounded wait.
void StopHelper(Helper& helper, core::logging::Logger* logger) {
  std::string error;
  bool running = false;
  if (!helper.process.Poll(running, error)) {
    LogIfPresent(logger, LogLevel::kWarn, "failed to poll monitor",
                 {{"monitor", helper.name}, {"error", error}});
    return;
  }
  if (!running) {
    return;
  }

  (void)helper.process.Signal(SIGINT);
  const auto deadline = std::chrono::steady_clock::now() + kHelperStopTimeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!helper.process.Poll(running, error)) {
      LogIfPresent(logger, LogLevel::kWarn, "failed to poll monitor",
                   {{"monitor", helper.name}, {"error", error}});
      return;
    }
    if (!running) {
      return;
    }
    std::this_thread::sleep_for(kHelperStopPoll);
  }

  LogIfPresent(logger, LogLevel::kWarn, "monitor ignored SIGINT; killing it",
               {{"monitor", helper.name}});
  (void)helper.process.Signal(SIGKILL);
  if (!helper.process.Wait(error)) {
    LogIfPresent(logger, LogLevel::kWarn, "failed to reap monitor",
                 {{"monitor", helper.name}, {"error", error}});
  }
}

void StopHelpers(std::vector<Helper>& helpers, core::logging::Logger* logger) {
  for (auto& helper : helpers) {
    StopHelper(helper, logger);
  }
}

LaunchSpec SarSpec(std::vector<std::string> argv, const fs::path& output) {
  LaunchSpec spec;
  spec.argv = std::move(argv);
  spec.stdout_path = output;
  spec.discard_output = true;
  spec.env_overrides = {{"LC_ALL", "C"}};
  return spec;
}

} // namespace

CapturePaths MakeCapturePaths(const fs::path& metrics_dir, const std::string& tag) {
  const aggregate::PhaseArtifacts artifacts = aggregate::PhaseArtifactsFor(metrics_dir, tag);
  CapturePaths paths;
  paths.time_report = artifacts.time_report;
  paths.status = metrics_dir / (tag + ".status");
  paths.dstat_csv = artifacts.dstat_csv;
  paths.sar = artifacts.sar;
  return paths;
}

bool RunCapture(const CaptureOptions& options, core::logging::Logger* logger,
                CaptureResult& result, std::string& error) {
  result = CaptureResult{};
  if (options.command.empty()) {
    result.failure = CaptureFailure::kInvalidOptions;
    error = "no command to capture";
    return false;
  }
  if (options.tag.empty() || options.tag.find('/') != std::string::npos) {
    result.failure = CaptureFailure::kInvalidOptions;
    error = "tag must be a non-empty file name component";
    return false;
  }
  if (!artifacts::EnsureOutputDir(options.metrics_dir, error)) {
    result.failure = CaptureFailure::kOutputFailed;
    return false;
  }

  result.paths = MakeCapturePaths(options.metrics_dir, options.tag);
  const CapturePaths& paths = result.paths;

  std::vector<Helper> helpers;
  if (options.use_dstat) {
    if (sampler::IsCommandOnPath("dstat")) {
      LaunchSpec spec;
      spec.argv = {"dstat", "--time", "--cpu", "--mem", "--io", "--net", "--output",
                   paths.dstat_csv.string(), "1"};
      spec.discard_output = true;
      const std::size_t before = helpers.size();
      StartHelper("dstat", spec, helpers, logger);
      result.dstat_started = helpers.size() > before;
      if (result.dstat_started) {
        // Short jobs still get at least one data row after the header.
        SleepSeconds(options.dstat_warmup_seconds);
      }
    } else {
      LogIfPresent(logger, LogLevel::kInfo, "dstat not found on PATH; skipping", {});
    }
  }

  if (options.use_sar) {
    if (sampler::IsCommandOnPath("sar")) {
      const std::size_t before = helpers.size();
      StartHelper("sar-cpu", SarSpec({"sar", "-u", "1"}, paths.sar.cpu), helpers, logger);
      StartHelper("sar-mem", SarSpec({"sar", "-r", "1"}, paths.sar.memory), helpers, logger);
      StartHelper("sar-dsk", SarSpec({"sar", "-b", "1"}, paths.sar.disk), helpers, logger);
      StartHelper("sar-net", SarSpec({"sar", "-n", "DEV", "1"}, paths.sar.network), helpers,
                  logger);
      result.sar_started = static_cast<int>(helpers.size() - before);
    } else {
      LogIfPresent(logger, LogLevel::kInfo, "sar not found on PATH; skipping", {});
    }
  }

  ChildProcess command;
  LaunchSpec spec;
  spec.argv = options.command;
  const auto start = std::chrono::steady_clock::now();
  if (!command.Launch(spec, error)) {
    result.failure = CaptureFailure::kLaunchFailed;
    LogIfPresent(logger, LogLevel::kError, "failed to launch captured command",
                 {{"command", options.command.front()}, {"error", error}});
    StopHelpers(helpers, logger);
    return false;
  }

  if (!command.Wait(error)) {
    result.failure = CaptureFailure::kWaitFailed;
    LogIfPresent(logger, LogLevel::kError, "failed to wait for captured command",
                 {{"error", error}});
    StopHelpers(helpers, logger);
    return false;
  }
  const double elapsed = core::SecondsBetween(start, std::chrono::steady_clock::now());
  result.exit_code = command.ExitCode();

  if (result.dstat_started) {
    // Lets dstat take one last sample covering the end of the run.
    SleepSeconds(kDstatGraceSeconds);
  }
  StopHelpers(helpers, logger);

  TimeReport report;
  report.command = options.command;
  report.elapsed_seconds = elapsed;
  report.usage = command.Usage();
  report.exit_status = result.exit_code;
  if (!core::WriteTextFileAtomic(paths.time_report, FormatTimeReport(report), error) ||
      !core::WriteTextFileAtomic(paths.status, std::to_string(result.exit_code) + "\n", error)) {
    result.failure = CaptureFailure::kOutputFailed;
    LogIfPresent(logger, LogLevel::kError, "failed to write capture report",
                 {{"metrics_dir", options.metrics_dir.string()}, {"error", error}});
    return false;
  }

  LogIfPresent(logger, LogLevel::kInfo, "capture finished",
               {{"tag", options.tag},
                {"exit_code", std::to_string(result.exit_code)},
                {"elapsed_sec", core::FormatFixedDouble(elapsed, 3)},
                {"max_rss_kb", std::to_string(report.usage.max_rss_kb)}});
  return true;
}

} // namespace benchtel::capture
