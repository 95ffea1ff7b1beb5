#pragma once

#include "sampler/child_process.hpp"

#include <string>
#include <vector>

namespace benchtel::capture {

// Inputs for one resource-usage report in the GNU `time -v` layout.
struct TimeReport {
  std::vector<std::string> command;
  double elapsed_seconds = 0.0;
  sampler::ChildUsage usage;
  int exit_status = 0;
};

// Wall-clock text as GNU time prints it: `m:ss.ss` below one hour,
// `h:mm:ss` from one hour on.
std::string FormatWallClock(double seconds);

// Renders the report lines, tab-indented, one per field:
//   Command being timed, User time (seconds), System time (seconds),
//   Percent of CPU this job got, Elapsed (wall clock) time (h:mm:ss or m:ss),
//   Maximum resident set size (kbytes), Exit status.
std::string FormatTimeReport(const TimeReport& report);

} // namespace benchtel::capture
