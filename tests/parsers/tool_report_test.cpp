#include "parsers/tool_report.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using benchtel::parsers::DurationFailurePolicy;
using benchtel::parsers::MatchToolReportLine;
using benchtel::parsers::ParseToolReportLines;
using benchtel::parsers::ReadToolReport;
using benchtel::parsers::ToolField;

TEST_CASE("GNU time verbose report yields all four fields", "[parsers][tool_report]") {
  const std::vector<std::string> lines = {
      "\tCommand being timed: \"spark-submit job.py\"",
      "\tUser time (seconds): 41.27",
      "\tSystem time (seconds): 3.08",
      "\tPercent of CPU this job got: 187%",
      "\tElapsed (wall clock) time (h:mm:ss or m:ss): 0:23.70",
      "\tAverage shared text size (kbytes): 0",
      "\tMaximum resident set size (kbytes): 812344",
      "\tExit status: 0",
  };

  const auto metrics = ParseToolReportLines(lines, DurationFailurePolicy::kAbsent);
  REQUIRE(metrics.elapsed_seconds.value() == 23.7);
  REQUIRE(metrics.user_cpu_seconds.value() == 41.27);
  REQUIRE(metrics.system_cpu_seconds.value() == 3.08);
  REQUIRE(metrics.max_rss_kb.value() == 812344);
}

TEST_CASE("Elapsed falls back to elapsed_seconds and real lines", "[parsers][tool_report]") {
  const auto from_seconds =
      ParseToolReportLines({"elapsed_seconds: 17"}, DurationFailurePolicy::kAbsent);
  REQUIRE(from_seconds.elapsed_seconds.value() == 17.0);
  REQUIRE_FALSE(from_seconds.user_cpu_seconds.has_value());
  REQUIRE_FALSE(from_seconds.max_rss_kb.has_value());

  const auto from_real = ParseToolReportLines({"real 4.50", "user 1.00", "sys 0.20"},
                                              DurationFailurePolicy::kAbsent);
  REQUIRE(from_real.elapsed_seconds.value() == 4.5);
}

TEST_CASE("First match per field wins", "[parsers][tool_report]") {
  const auto metrics = ParseToolReportLines(
      {"Elapsed (wall clock) time (h:mm:ss or m:ss): 1:00:00", "elapsed_seconds: 5",
       "User time (seconds): 1.50", "User time (seconds): 9.00"},
      DurationFailurePolicy::kAbsent);
  REQUIRE(metrics.elapsed_seconds.value() == 3600.0);
  REQUIRE(metrics.user_cpu_seconds.value() == 1.5);
}

TEST_CASE("Unparsable elapsed text follows the duration policy", "[parsers][tool_report]") {
  const std::vector<std::string> lines = {"Elapsed (wall clock) time (h:mm:ss or m:ss): ??"};
  REQUIRE_FALSE(
      ParseToolReportLines(lines, DurationFailurePolicy::kAbsent).elapsed_seconds.has_value());
  REQUIRE(ParseToolReportLines(lines, DurationFailurePolicy::kZero).elapsed_seconds.value() ==
          0.0);
}

TEST_CASE("Unrelated lines do not match any pattern", "[parsers][tool_report]") {
  REQUIRE_FALSE(MatchToolReportLine("Exit status: 0").has_value());
  REQUIRE_FALSE(MatchToolReportLine("").has_value());

  const auto match = MatchToolReportLine("   Maximum resident set size (kbytes): 2048   ");
  REQUIRE(match.has_value());
  REQUIRE(match->field == ToolField::kMaxRssKb);
  REQUIRE(match->raw_value == "2048");
}

TEST_CASE("Missing report file yields all-absent metrics", "[parsers][tool_report]") {
  const auto metrics =
      ReadToolReport("/nonexistent/benchtel/job.time", DurationFailurePolicy::kAbsent);
  REQUIRE_FALSE(metrics.elapsed_seconds.has_value());
  REQUIRE_FALSE(metrics.user_cpu_seconds.has_value());
  REQUIRE_FALSE(metrics.system_cpu_seconds.has_value());
  REQUIRE_FALSE(metrics.max_rss_kb.has_value());
}
