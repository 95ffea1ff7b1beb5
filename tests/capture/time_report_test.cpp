#include "capture/time_report.hpp"
#include "parsers/tool_report.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using benchtel::capture::FormatTimeReport;
using benchtel::capture::FormatWallClock;
using benchtel::capture::TimeReport;

TEST_CASE("Wall clock text switches layout at one hour", "[capture][time_report]") {
  REQUIRE(FormatWallClock(5.5) == "0:05.50");
  REQUIRE(FormatWallClock(187.25) == "3:07.25");
  REQUIRE(FormatWallClock(59.999) == "1:00.00");
  REQUIRE(FormatWallClock(3723.0) == "1:02:03");
  REQUIRE(FormatWallClock(-1.0) == "0:00.00");
}

TEST_CASE("Generated report parses back through the tool-report patterns",
          "[capture][time_report]") {
  TimeReport report;
  report.command = {"hadoop", "jar", "degree.jar"};
  report.elapsed_seconds = 125.5;
  report.usage.user_cpu_seconds = 40.25;
  report.usage.system_cpu_seconds = 2.5;
  report.usage.max_rss_kb = 524288;
  report.exit_status = 3;

  const std::string text = FormatTimeReport(report);
  REQUIRE(text.find("\tCommand being timed: \"hadoop jar degree.jar\"\n") != std::string::npos);
  REQUIRE(text.find("\tPercent of CPU this job got: 34%\n") != std::string::npos);
  REQUIRE(text.find("\tExit status: 3\n") != std::string::npos);

  std::vector<std::string> lines;
  std::size_t start = 0;
  for (std::size_t end = text.find('\n'); end != std::string::npos; end = text.find('\n', start)) {
    lines.push_back(text.substr(start, end - start));
    start = end + 1U;
  }

  const auto metrics = benchtel::parsers::ParseToolReportLines(
      lines, benchtel::parsers::DurationFailurePolicy::kAbsent);
  REQUIRE(metrics.elapsed_seconds.value() == 125.5);
  REQUIRE(metrics.user_cpu_seconds.value() == 40.25);
  REQUIRE(metrics.system_cpu_seconds.value() == 2.5);
  REQUIRE(metrics.max_rss_kb.value() == 524288);
}

TEST_CASE("CPU percent is unknown for a zero-length run", "[capture][time_report]") {
  TimeReport report;
  report.command = {"true"};
  REQUIRE(FormatTimeReport(report).find("Percent of CPU this job got: ?%") != std::string::npos);
}
