#include "benchtel/cli/router.hpp"

#include "aggregate/aggregator.hpp"
#include "artifacts/summary_table_writer.hpp"
#include "capture/tool_capture.hpp"
#include "compare/perf_compare.hpp"
#include "compare/summary_table_reader.hpp"
#include "core/config/path_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/text_utils.hpp"
#include "hostprobe/host_counters.hpp"
#include "sampler/supervisor.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace benchtel::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitLaunchFailed = core::errors::ToInt(core::errors::ExitCode::kLaunchFailed);
constexpr int kExitOutputUnwritable =
    core::errors::ToInt(core::errors::ExitCode::kOutputUnwritable);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  benchtel sample --system <name> --dataset <name> [--out-root <dir>] "
         "[--data-root <dir>] [--interval <sec>] [--log-level <debug|info|warn|error>] "
         "-- <command> [args...]\n"
      << "  benchtel capture <metrics_dir> <tag> [--no-dstat] [--no-sar] "
         "[--dstat-warmup <sec>] [--log-level <debug|info|warn|error>] "
         "-- <command> [args...]\n"
      << "  benchtel aggregate [--data-root <dir>] [--out <file>] [--jobs <n>] "
         "[--include-sampled] [--zero-duration-on-parse-failure] [--keep-zero-rates] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  benchtel compare [--summary <csv>] [--data-root <dir>] [--left <fw>] "
         "[--right <fw>]\n"
      << "  benchtel version\n";
}

// Splits `args` at the first `--`; everything after it is the command.
void SplitCommand(const std::vector<std::string_view>& args,
                  std::vector<std::string_view>& options, std::vector<std::string>& command) {
  options.clear();
  command.clear();
  bool in_command = false;
  for (const auto token : args) {
    if (!in_command && token == "--") {
      in_command = true;
      continue;
    }
    if (in_command) {
      command.emplace_back(token);
    } else {
      options.push_back(token);
    }
  }
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

bool ParsePositiveSeconds(std::string_view flag, std::string_view raw, double& seconds,
                          std::string& error) {
  const auto parsed = core::ParseDouble(raw);
  if (!parsed.has_value() || !(*parsed > 0.0)) {
    error = std::string(flag) + " must be a positive number of seconds: " + std::string(raw);
    return false;
  }
  seconds = *parsed;
  return true;
}

bool ParseLogLevelFlag(const std::vector<std::string_view>& args, std::size_t& i,
                       core::logging::LogLevel& level, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for --log-level";
    return false;
  }
  if (!core::logging::ParseLogLevel(args[i + 1], level, error)) {
    return false;
  }
  ++i;
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::cout << "benchtel 0.1.0\n";
  return kExitSuccess;
}

struct SampleCommandOptions {
  sampler::SamplerOptions sampler;
  std::optional<fs::path> data_root;
  std::optional<fs::path> out_root;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool ParseSampleOptions(const std::vector<std::string_view>& args, SampleCommandOptions& options,
                        std::string& error) {
  std::vector<std::string_view> flags;
  SplitCommand(args, flags, options.sampler.command);

  for (std::size_t i = 0; i < flags.size(); ++i) {
    const std::string_view token = flags[i];
    std::string value;
    if (token == "--system") {
      if (!TakeValue(flags, i, token, options.sampler.system, error)) {
        return false;
      }
      continue;
    }
    if (token == "--dataset") {
      if (!TakeValue(flags, i, token, options.sampler.dataset, error)) {
        return false;
      }
      continue;
    }
    if (token == "--out-root") {
      if (!TakeValue(flags, i, token, value, error)) {
        return false;
      }
      options.out_root = fs::path(value);
      continue;
    }
    if (token == "--data-root") {
      if (!TakeValue(flags, i, token, value, error)) {
        return false;
      }
      options.data_root = fs::path(value);
      continue;
    }
    if (token == "--interval") {
      if (!TakeValue(flags, i, token, value, error) ||
          !ParsePositiveSeconds(token, value, options.sampler.interval_seconds, error)) {
        return false;
      }
      if (options.sampler.interval_seconds > sampler::kMaxIntervalSeconds) {
        error = "--interval must not exceed " +
                core::FormatShortestDouble(sampler::kMaxIntervalSeconds) + " seconds: " + value;
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(flags, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.sampler.system.empty()) {
    error = "sample requires --system <name>";
    return false;
  }
  if (options.sampler.dataset.empty()) {
    error = "sample requires --dataset <name>";
    return false;
  }
  if (options.sampler.command.empty()) {
    error = "sample requires a command after --";
    return false;
  }
  return true;
}

int CommandSample(const std::vector<std::string_view>& args) {
  SampleCommandOptions options;
  std::string error;
  if (!ParseSampleOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const core::config::PathConfig paths = core::config::ResolvePathConfig(options.data_root);
  options.sampler.out_root = options.out_root.value_or(paths.sampled_root);

  core::logging::Logger logger(options.log_level);
  logger.SetScope(options.sampler.system + "/" + options.sampler.dataset);
  logger.Info("sample requested", {{"out_root", options.sampler.out_root.string()},
                                   {"command", options.sampler.command.front()}});

  hostprobe::PlatformCounterSource source;
  sampler::SupervisionResult result;
  if (!sampler::SuperviseCommand(options.sampler, source, &logger, result, error)) {
    std::cerr << "error: " << error << '\n';
    switch (result.failure) {
    case sampler::SupervisionFailure::kLaunchFailed:
      return kExitLaunchFailed;
    case sampler::SupervisionFailure::kInvalidOptions:
      PrintUsage(std::cerr);
      return kExitUsage;
    case sampler::SupervisionFailure::kNone:
    case sampler::SupervisionFailure::kOutputFailed:
    case sampler::SupervisionFailure::kWaitFailed:
      return kExitFailure;
    }
    return kExitFailure;
  }

  if (result.child_exit_code != 0) {
    logger.Warn("supervised command exited with non-zero status",
                {{"exit_code", std::to_string(result.child_exit_code)}});
  }
  std::cout << "summary: " << result.summary_path.string() << '\n';
  std::cout << "timeseries: " << result.timeseries_path.string() << '\n';
  return kExitSuccess;
}

bool ParseCaptureOptions(const std::vector<std::string_view>& args,
                         capture::CaptureOptions& options, core::logging::LogLevel& log_level,
                         std::string& error) {
  std::vector<std::string_view> flags;
  SplitCommand(args, flags, options.command);

  std::vector<std::string> positionals;
  for (std::size_t i = 0; i < flags.size(); ++i) {
    const std::string_view token = flags[i];
    if (token == "--no-dstat") {
      options.use_dstat = false;
      continue;
    }
    if (token == "--no-sar") {
      options.use_sar = false;
      continue;
    }
    if (token == "--dstat-warmup") {
      std::string value;
      if (!TakeValue(flags, i, token, value, error)) {
        return false;
      }
      const auto parsed = core::ParseDouble(value);
      if (!parsed.has_value() || *parsed < 0.0) {
        error = "--dstat-warmup must be a non-negative number of seconds: " + value;
        return false;
      }
      options.dstat_warmup_seconds = *parsed;
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(flags, i, log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.emplace_back(token);
  }

  if (positionals.size() != 2U) {
    error = "capture requires exactly 2 arguments: <metrics_dir> <tag>";
    return false;
  }
  options.metrics_dir = fs::path(positionals[0]);
  options.tag = positionals[1];
  if (options.command.empty()) {
    error = "capture requires a command after --";
    return false;
  }
  return true;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  capture::CaptureOptions options;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::string error;
  if (!ParseCaptureOptions(args, options, log_level, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(log_level);
  logger.SetScope(options.tag);

  capture::CaptureResult result;
  if (!capture::RunCapture(options, &logger, result, error)) {
    std::cerr << "error: " << error << '\n';
    switch (result.failure) {
    case capture::CaptureFailure::kLaunchFailed:
      return kExitLaunchFailed;
    case capture::CaptureFailure::kInvalidOptions:
      PrintUsage(std::cerr);
      return kExitUsage;
    case capture::CaptureFailure::kNone:
    case capture::CaptureFailure::kOutputFailed:
    case capture::CaptureFailure::kWaitFailed:
      return kExitFailure;
    }
    return kExitFailure;
  }
  return result.exit_code;
}

struct AggregateCommandOptions {
  aggregate::AggregateOptions aggregate;
  std::optional<fs::path> data_root;
  std::optional<fs::path> out;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool ParseAggregateOptions(const std::vector<std::string_view>& args,
                           AggregateCommandOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--include-sampled") {
      options.aggregate.include_sampled = true;
      continue;
    }
    if (token == "--zero-duration-on-parse-failure") {
      options.aggregate.duration_policy = parsers::DurationFailurePolicy::kZero;
      continue;
    }
    if (token == "--keep-zero-rates") {
      options.aggregate.zero_rate_policy = parsers::ZeroRatePolicy::kReportResolvedColumns;
      continue;
    }
    if (token == "--data-root") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.data_root = fs::path(value);
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.out = fs::path(value);
      continue;
    }
    if (token == "--jobs") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      const auto jobs = core::ParseInteger(value);
      if (!jobs.has_value() || *jobs < 1 || *jobs > 256) {
        error = "--jobs must be an integer between 1 and 256: " + value;
        return false;
      }
      options.aggregate.jobs = static_cast<unsigned>(*jobs);
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

int CommandAggregate(const std::vector<std::string_view>& args) {
  AggregateCommandOptions options;
  std::string error;
  if (!ParseAggregateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const core::config::PathConfig paths = core::config::ResolvePathConfig(options.data_root);
  const fs::path primary = options.out.value_or(paths.summary_csv);
  const fs::path fallback =
      options.out.has_value() ? core::config::AlternateOutputPath(primary) : paths.summary_alt_csv;

  core::logging::Logger logger(options.log_level);
  logger.Info("aggregate requested", {{"data_root", paths.data_root.string()},
                                      {"out", primary.string()},
                                      {"include_sampled",
                                       options.aggregate.include_sampled ? "true" : "false"}});

  std::vector<aggregate::MetricsRecord> records;
  if (!aggregate::CollectRecords(paths, options.aggregate, &logger, records, error)) {
    logger.Error("failed to collect metrics records", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  artifacts::SummaryTableWriteOutcome outcome;
  if (!artifacts::WriteSummaryTable(records, primary, fallback, outcome, error)) {
    logger.Error("summary table could not be written", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitOutputUnwritable;
  }

  if (outcome.used_fallback) {
    logger.Warn("primary summary destination unwritable; wrote fallback",
                {{"primary", primary.string()},
                 {"fallback", outcome.written_path.string()},
                 {"error", outcome.primary_error}});
    std::cout << "could not write " << primary.string() << "; wrote fallback "
              << outcome.written_path.string() << '\n';
  } else {
    std::cout << "wrote " << outcome.written_path.string() << '\n';
  }
  std::cout << "rows: " << records.size() << '\n';
  return kExitSuccess;
}

struct CompareCommandOptions {
  std::optional<fs::path> summary;
  std::optional<fs::path> data_root;
  std::string left = "spark";
  std::string right = "hadoop";
};

bool ParseCompareOptions(const std::vector<std::string_view>& args, CompareCommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string value;
    if (token == "--summary") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.summary = fs::path(value);
      continue;
    }
    if (token == "--data-root") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.data_root = fs::path(value);
      continue;
    }
    if (token == "--left") {
      if (!TakeValue(args, i, token, options.left, error)) {
        return false;
      }
      continue;
    }
    if (token == "--right") {
      if (!TakeValue(args, i, token, options.right, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  if (options.left.empty() || options.right.empty()) {
    error = "--left and --right cannot be empty";
    return false;
  }
  return true;
}

int CommandCompare(const std::vector<std::string_view>& args) {
  CompareCommandOptions options;
  std::string error;
  if (!ParseCompareOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const core::config::PathConfig paths = core::config::ResolvePathConfig(options.data_root);
  const fs::path summary_path = options.summary.value_or(paths.summary_csv);

  std::vector<aggregate::MetricsRecord> records;
  if (!compare::ReadSummaryTable(summary_path, records, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << compare::RenderComparison(records, options.left, options.right);
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "sample") {
    return CommandSample(args);
  }

  if (command == "capture") {
    return CommandCapture(args);
  }

  if (command == "aggregate") {
    return CommandAggregate(args);
  }

  if (command == "compare") {
    return CommandCompare(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace benchtel::cli
