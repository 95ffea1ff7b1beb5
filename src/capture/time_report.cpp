#include "capture/time_report.hpp"

#include "core/text_utils.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace benchtel::capture {

namespace {

std::string JoinCommand(const std::vector<std::string>& command) {
  std::string joined;
  for (const auto& arg : command) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += arg;
  }
  return joined;
}

std::string FormatCpuPercent(const TimeReport& report) {
  if (report.elapsed_seconds <= 0.0) {
    return "?%";
  }
  const double cpu_seconds = report.usage.user_cpu_seconds + report.usage.system_cpu_seconds;
  const auto percent = static_cast<std::int64_t>(cpu_seconds / report.elapsed_seconds * 100.0);
  return std::to_string(percent) + "%";
}

} // namespace

std::string FormatWallClock(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) {
    seconds = 0.0;
  }

  char buffer[64];
  if (seconds < 3600.0) {
    // Work in hundredths so rounding never yields "60.00" seconds.
    const auto hundredths = static_cast<std::int64_t>(std::llround(seconds * 100.0));
    const std::int64_t minutes = hundredths / 6000;
    const std::int64_t rest = hundredths % 6000;
    std::snprintf(buffer, sizeof(buffer), "%lld:%02lld.%02lld", static_cast<long long>(minutes),
                  static_cast<long long>(rest / 100), static_cast<long long>(rest % 100));
    return buffer;
  }

  const auto whole = static_cast<std::int64_t>(seconds);
  std::snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld",
                static_cast<long long>(whole / 3600), static_cast<long long>((whole / 60) % 60),
                static_cast<long long>(whole % 60));
  return buffer;
}

std::string FormatTimeReport(const TimeReport& report) {
  std::string text;
  text += "\tCommand being timed: \"" + JoinCommand(report.command) + "\"\n";
  text += "\tUser time (seconds): " + core::FormatFixedDouble(report.usage.user_cpu_seconds, 2) +
          "\n";
  text += "\tSystem time (seconds): " +
          core::FormatFixedDouble(report.usage.system_cpu_seconds, 2) + "\n";
  text += "\tPercent of CPU this job got: " + FormatCpuPercent(report) + "\n";
  text += "\tElapsed (wall clock) time (h:mm:ss or m:ss): " +
          FormatWallClock(report.elapsed_seconds) + "\n";
  text += "\tMaximum resident set size (kbytes): " + std::to_string(report.usage.max_rss_kb) +
          "\n";
  text += "\tExit status: " + std::to_string(report.exit_status) + "\n";
  return text;
}

} // namespace benchtel::capture
