#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"
#include "parsers/tool_report.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using namespace benchtel::tests::common;
  using benchtel::parsers::DurationFailurePolicy;

  const fs::path root = CreateUniqueTempDir("benchtel-capture-smoke");
  const fs::path metrics_dir = root / "metrics" / "hadoop" / "web-Google";

  // The command's exit status is both recorded and returned.
  const int exit_code =
      DispatchArgs({"benchtel", "capture", metrics_dir.string(), "indegree", "--no-dstat",
                    "--no-sar", "--log-level", "error", "--", "sh", "-c", "sleep 0.2; exit 3"});
  AssertExitCode(exit_code, 3, "capture should pass through the command's exit code");

  AssertTrue(ReadFileToString(metrics_dir / "indegree.status") == "3\n", "status file content");
  const std::string report = ReadFileToString(metrics_dir / "indegree.time");
  AssertContains(report, "Command being timed: \"sh -c sleep 0.2; exit 3\"");
  AssertContains(report, "Exit status: 3");
  AssertTrue(!fs::exists(metrics_dir / "indegree.dstat.csv"), "dstat disabled");
  AssertTrue(!fs::exists(metrics_dir / "indegree.sar.cpu.txt"), "sar disabled");

  // The report reads back through the same parser the aggregator uses.
  const auto parsed =
      benchtel::parsers::ReadToolReport(metrics_dir / "indegree.time", DurationFailurePolicy::kAbsent);
  AssertTrue(parsed.elapsed_seconds.has_value(), "elapsed parsed from wall clock line");
  AssertTrue(*parsed.elapsed_seconds >= 0.15 && *parsed.elapsed_seconds < 10.0,
             "elapsed covers the command");
  AssertTrue(parsed.max_rss_kb.has_value() && *parsed.max_rss_kb > 0, "max rss parsed");
  AssertTrue(parsed.user_cpu_seconds.has_value(), "user time parsed");
  AssertTrue(parsed.system_cpu_seconds.has_value(), "system time parsed");

  // A command that cannot be launched leaves no report behind.
  AssertExitCode(DispatchArgs({"benchtel", "capture", metrics_dir.string(), "distribution",
                               "--no-dstat", "--no-sar", "--log-level", "error", "--",
                               "/nonexistent/benchtel-no-such-binary"}),
                 20, "launch failure exit code");
  AssertTrue(!fs::exists(metrics_dir / "distribution.time"), "no report after launch failure");
  AssertTrue(!fs::exists(metrics_dir / "distribution.status"), "no status after launch failure");

  // Tags cannot escape the metrics directory.
  AssertExitCode(DispatchArgs({"benchtel", "capture", metrics_dir.string(), "a/b", "--no-dstat",
                               "--no-sar", "--", "true"}),
                 2, "tag with a path separator");

  AssertExitCode(DispatchArgs({"benchtel", "capture", metrics_dir.string(), "job"}), 2,
                 "missing command");

  RemovePathBestEffort(root);
  return 0;
}
