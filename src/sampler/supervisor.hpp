#pragma once

#include "core/logging/logger.hpp"
#include "hostprobe/host_counters.hpp"
#include "sampler/run_types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace benchtel::sampler {

inline constexpr double kDefaultIntervalSeconds = 1.0;
// Floor on the polling interval; bounds the sampler's own overhead.
inline constexpr double kMinIntervalSeconds = 0.2;
// Ceiling on the polling interval; keeps the sleep representable on the
// steady clock and bounds how long a child's exit can go unnoticed.
inline constexpr double kMaxIntervalSeconds = 3600.0;

struct SamplerOptions {
  std::string system;
  std::string dataset;
  // Artifacts land in <out_root>/<system>/<dataset>/.
  std::filesystem::path out_root;
  double interval_seconds = kDefaultIntervalSeconds;
  std::vector<std::string> command;
};

// Requested interval clamped to [kMinIntervalSeconds, kMaxIntervalSeconds].
// Non-finite values fall back to the default.
double EffectiveInterval(double requested_seconds);

std::filesystem::path RunOutputDir(const SamplerOptions& options);

enum class SupervisionFailure {
  kNone,
  kInvalidOptions,
  kLaunchFailed,
  kOutputFailed,
  kWaitFailed,
};

struct SupervisionResult {
  RunSummary summary;
  std::filesystem::path output_dir;
  std::filesystem::path timeseries_path;
  std::filesystem::path summary_path;
  // Child's exit status in shell convention (128 + signal when killed).
  int child_exit_code = -1;
  SupervisionFailure failure = SupervisionFailure::kNone;
};

// Runs `options.command` to completion while sampling host counters.
//
// Protocol:
// - baseline disk/network counters are read before launch
// - the loop polls the child without blocking; while it runs one sample is
//   taken per interval, and one final sample is taken after it exits
// - elapsed time comes from the monotonic clock
// - summary.json is written once, after the child has been reaped
//
// When the command cannot be launched nothing is written and the result
// carries kLaunchFailed. There is no timeout: a child that never exits keeps
// the supervisor waiting.
bool SuperviseCommand(const SamplerOptions& options, hostprobe::HostCounterSource& source,
                      core::logging::Logger* logger, SupervisionResult& result,
                      std::string& error);

} // namespace benchtel::sampler
