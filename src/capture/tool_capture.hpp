#pragma once

#include "core/logging/logger.hpp"
#include "parsers/sar_report.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace benchtel::capture {

inline constexpr double kDefaultDstatWarmupSeconds = 2.0;
inline constexpr double kDstatGraceSeconds = 1.0;

struct CaptureOptions {
  std::filesystem::path metrics_dir;
  std::string tag;
  bool use_dstat = true;
  bool use_sar = true;
  double dstat_warmup_seconds = kDefaultDstatWarmupSeconds;
  std::vector<std::string> command;
};

// Artifact names for one tag inside a metrics directory. These are the files
// the aggregator reads back for phase `<tag>`.
struct CapturePaths {
  std::filesystem::path time_report;
  std::filesystem::path status;
  std::filesystem::path dstat_csv;
  parsers::SarReportPaths sar;
};

CapturePaths MakeCapturePaths(const std::filesystem::path& metrics_dir, const std::string& tag);

enum class CaptureFailure {
  kNone,
  kInvalidOptions,
  kLaunchFailed,
  kOutputFailed,
  kWaitFailed,
};

struct CaptureResult {
  CapturePaths paths;
  // Command's exit status (128 + signal when killed by a signal).
  int exit_code = -1;
  bool dstat_started = false;
  int sar_started = 0;
  CaptureFailure failure = CaptureFailure::kNone;
};

// Runs the command under optional dstat/sar monitors and writes the
// `<tag>.time` report and `<tag>.status`. Monitors that are disabled or not on
// PATH are skipped; a monitor that fails to start is logged and skipped.
// If the command itself cannot be launched, monitors are stopped and neither
// `.time` nor `.status` is written.
bool RunCapture(const CaptureOptions& options, core::logging::Logger* logger,
                CaptureResult& result, std::string& error);

} // namespace benchtel::capture
