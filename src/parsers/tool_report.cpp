#include "parsers/tool_report.hpp"

#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"
#include "parsers/duration.hpp"

namespace benchtel::parsers {

namespace {

std::vector<LinePattern> BuildPatterns() {
  std::vector<LinePattern> patterns;
  patterns.push_back({ToolField::kUserCpuSeconds, "user_time",
                      std::regex(R"(User time \(seconds\):\s*(\d+(?:\.\d+)?))"), false});
  patterns.push_back({ToolField::kSystemCpuSeconds, "system_time",
                      std::regex(R"(System time \(seconds\):\s*(\d+(?:\.\d+)?))"), false});
  patterns.push_back({ToolField::kMaxRssKb, "max_rss",
                      std::regex(R"(Maximum resident set size \(kbytes\):\s*(\d+))"), false});
  patterns.push_back({ToolField::kElapsedSeconds, "elapsed_wall_clock",
                      std::regex(R"(Elapsed \(wall clock\) time .*: (.+))"), true});
  patterns.push_back({ToolField::kElapsedSeconds, "elapsed_seconds",
                      std::regex(R"(elapsed_seconds:\s*(\d+(?:\.\d+)?))"), false});
  patterns.push_back(
      {ToolField::kElapsedSeconds, "real", std::regex(R"(real\s*(\d+\.\d+))"), false});
  return patterns;
}

} // namespace

const char* ToString(ToolField field) {
  switch (field) {
  case ToolField::kElapsedSeconds:
    return "elapsed_seconds";
  case ToolField::kUserCpuSeconds:
    return "cpu_user_s";
  case ToolField::kSystemCpuSeconds:
    return "cpu_sys_s";
  case ToolField::kMaxRssKb:
    return "max_rss_kb";
  }
  return "unknown";
}

const std::vector<LinePattern>& ToolReportPatterns() {
  static const std::vector<LinePattern> patterns = BuildPatterns();
  return patterns;
}

std::optional<PatternMatch> MatchToolReportLine(std::string_view line) {
  const std::string trimmed(core::Trim(line));
  if (trimmed.empty()) {
    return std::nullopt;
  }

  for (const auto& pattern : ToolReportPatterns()) {
    std::smatch match;
    if (std::regex_match(trimmed, match, pattern.expression) && match.size() > 1U) {
      return PatternMatch{pattern.field, match[1].str(), pattern.capture_is_duration};
    }
  }
  return std::nullopt;
}

ParsedToolMetrics ParseToolReportLines(const std::vector<std::string>& lines,
                                       DurationFailurePolicy duration_policy) {
  ParsedToolMetrics metrics;
  for (const auto& line : lines) {
    const auto match = MatchToolReportLine(line);
    if (!match.has_value()) {
      continue;
    }

    switch (match->field) {
    case ToolField::kElapsedSeconds: {
      if (metrics.elapsed_seconds.has_value()) {
        break;
      }
      std::optional<double> seconds = match->capture_is_duration
                                          ? TryParseDurationSeconds(match->raw_value)
                                          : core::ParseDouble(match->raw_value);
      if (!seconds.has_value() && duration_policy == DurationFailurePolicy::kZero) {
        seconds = 0.0;
      }
      metrics.elapsed_seconds = seconds;
      break;
    }
    case ToolField::kUserCpuSeconds:
      if (!metrics.user_cpu_seconds.has_value()) {
        metrics.user_cpu_seconds = core::ParseDouble(match->raw_value);
      }
      break;
    case ToolField::kSystemCpuSeconds:
      if (!metrics.system_cpu_seconds.has_value()) {
        metrics.system_cpu_seconds = core::ParseDouble(match->raw_value);
      }
      break;
    case ToolField::kMaxRssKb:
      if (!metrics.max_rss_kb.has_value()) {
        if (const auto kb = core::ParseInteger(match->raw_value); kb.has_value()) {
          metrics.max_rss_kb = static_cast<std::int64_t>(*kb);
        }
      }
      break;
    }
  }
  return metrics;
}

ParsedToolMetrics ReadToolReport(const std::filesystem::path& path,
                                 DurationFailurePolicy duration_policy) {
  return ParseToolReportLines(core::ReadLinesIfPresent(path), duration_policy);
}

} // namespace benchtel::parsers
