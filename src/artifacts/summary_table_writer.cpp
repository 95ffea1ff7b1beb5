#include "artifacts/summary_table_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"

#include <optional>

namespace benchtel::artifacts {

namespace {

// Quotes a cell only when it carries a delimiter, quote or line break.
std::string CsvCell(std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(value);
  }
  std::string quoted = "\"";
  for (const char c : value) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string OptionalCell(const std::optional<double>& value) {
  return value.has_value() ? core::FormatShortestDouble(*value) : std::string();
}

std::string OptionalCell(const std::optional<std::int64_t>& value) {
  return value.has_value() ? std::to_string(*value) : std::string();
}

void AppendRow(std::string& out, const std::vector<std::string>& cells) {
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i > 0U) {
      out += ',';
    }
    out += cells[i];
  }
  out += '\n';
}

} // namespace

std::string RenderSummaryTable(const std::vector<aggregate::MetricsRecord>& records) {
  std::string out;
  AppendRow(out, std::vector<std::string>(aggregate::kSummaryColumns.begin(),
                                          aggregate::kSummaryColumns.end()));
  for (const auto& record : records) {
    AppendRow(out, {
                       CsvCell(record.framework),
                       CsvCell(record.dataset),
                       CsvCell(record.phase),
                       OptionalCell(record.tool.elapsed_seconds),
                       OptionalCell(record.tool.max_rss_kb),
                       OptionalCell(record.tool.user_cpu_seconds),
                       OptionalCell(record.tool.system_cpu_seconds),
                       OptionalCell(record.averages.avg_cpu_util),
                       OptionalCell(record.averages.avg_mem_used_mb),
                       OptionalCell(record.averages.avg_dsk_read_kbps),
                       OptionalCell(record.averages.avg_dsk_writ_kbps),
                       OptionalCell(record.averages.avg_net_recv_kbps),
                       OptionalCell(record.averages.avg_net_send_kbps),
                   });
  }
  return out;
}

bool WriteSummaryTable(const std::vector<aggregate::MetricsRecord>& records,
                       const std::filesystem::path& primary,
                       const std::filesystem::path& fallback, SummaryTableWriteOutcome& outcome,
                       std::string& error) {
  outcome = SummaryTableWriteOutcome{};
  const std::string table = RenderSummaryTable(records);

  std::string primary_error;
  if (core::EnsureParentDirectory(primary, primary_error) &&
      core::WriteTextFileAtomic(primary, table, primary_error)) {
    outcome.written_path = primary;
    return true;
  }

  outcome.used_fallback = true;
  outcome.primary_error = primary_error;
  std::string fallback_error;
  if (core::EnsureParentDirectory(fallback, fallback_error) &&
      core::WriteTextFileAtomic(fallback, table, fallback_error)) {
    outcome.written_path = fallback;
    return true;
  }

  error = "failed to write '" + primary.string() + "' (" + primary_error + ") and fallback '" +
          fallback.string() + "' (" + fallback_error + ")";
  return false;
}

} // namespace benchtel::artifacts
