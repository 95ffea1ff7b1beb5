#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace benchtel::parsers {

// Typed fields a resource-usage report line can carry.
enum class ToolField {
  kElapsedSeconds,
  kUserCpuSeconds,
  kSystemCpuSeconds,
  kMaxRssKb,
};

const char* ToString(ToolField field);

// One declarative rule: a whole-line pattern (applied to the trimmed line) whose
// first capture group holds the field's raw text.
struct LinePattern {
  ToolField field;
  std::string_view name;
  std::regex expression;
  // Elapsed wall-clock captures are durations (`h:mm:ss`, `m:ss`); the rest
  // are plain decimals.
  bool capture_is_duration = false;
};

// Rule table in evaluation order. Three phrasings feed the elapsed field:
// GNU time's "Elapsed (wall clock) time ...: <duration>", the
// "elapsed_seconds: <seconds>" fallback line, and "real <seconds>".
const std::vector<LinePattern>& ToolReportPatterns();

struct PatternMatch {
  ToolField field;
  std::string raw_value;
  bool capture_is_duration = false;
};

// Applies the rule table to one line; the first matching rule wins.
std::optional<PatternMatch> MatchToolReportLine(std::string_view line);

// Each field is independently present or absent; absence is never zero.
struct ParsedToolMetrics {
  std::optional<double> elapsed_seconds;
  std::optional<double> user_cpu_seconds;
  std::optional<double> system_cpu_seconds;
  std::optional<std::int64_t> max_rss_kb;
};

enum class DurationFailurePolicy {
  // Unparsable elapsed text leaves the field absent (a later line may fill it).
  kAbsent,
  // Unparsable elapsed text records 0.0 seconds.
  kZero,
};

// Single pass over the lines; the first occurrence of each field wins.
ParsedToolMetrics ParseToolReportLines(const std::vector<std::string>& lines,
                                       DurationFailurePolicy duration_policy);

// Reads a report file. A missing file yields an all-absent result.
ParsedToolMetrics ReadToolReport(const std::filesystem::path& path,
                                 DurationFailurePolicy duration_policy);

} // namespace benchtel::parsers
