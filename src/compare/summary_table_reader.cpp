#include "compare/summary_table_reader.hpp"

#include "core/text_utils.hpp"
#include "parsers/csv_line.hpp"

#include <cmath>
#include <map>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace benchtel::compare {

namespace {

class RowView {
public:
  RowView(const std::map<std::string, std::size_t>& columns, const std::vector<std::string>& row)
      : columns_(columns), row_(row) {}

  std::string Text(const std::string& column) const {
    const auto it = columns_.find(column);
    if (it == columns_.end() || it->second >= row_.size()) {
      return {};
    }
    return std::string(core::Trim(row_[it->second]));
  }

  std::optional<double> Number(const std::string& column) const {
    const std::string text = Text(column);
    if (text.empty()) {
      return std::nullopt;
    }
    return core::ParseDouble(text);
  }

private:
  const std::map<std::string, std::size_t>& columns_;
  const std::vector<std::string>& row_;
};

} // namespace

bool ReadSummaryTable(const fs::path& path, std::vector<aggregate::MetricsRecord>& records,
                      std::string& error) {
  records.clear();
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "summary table not found: " + path.string();
    return false;
  }

  const auto rows = parsers::ReadCsvRows(path);
  if (rows.empty()) {
    error = "summary table is empty: " + path.string();
    return false;
  }

  std::map<std::string, std::size_t> columns;
  for (std::size_t i = 0; i < rows.front().size(); ++i) {
    columns.emplace(std::string(core::Trim(rows.front()[i])), i);
  }
  for (const char* required : {"framework", "dataset", "phase"}) {
    if (columns.find(required) == columns.end()) {
      error = std::string("summary table is missing column '") + required + "': " + path.string();
      return false;
    }
  }

  for (std::size_t i = 1; i < rows.size(); ++i) {
    if (rows[i].empty()) {
      continue;
    }
    const RowView row(columns, rows[i]);
    aggregate::MetricsRecord record;
    record.framework = row.Text("framework");
    record.dataset = row.Text("dataset");
    record.phase = row.Text("phase");
    record.tool.elapsed_seconds = row.Number("elapsed_seconds");
    if (const auto rss = row.Number("max_rss_kb")) {
      record.tool.max_rss_kb = static_cast<std::int64_t>(std::llround(*rss));
    }
    record.tool.user_cpu_seconds = row.Number("cpu_user_s");
    record.tool.system_cpu_seconds = row.Number("cpu_sys_s");
    record.averages.avg_cpu_util = row.Number("avg_cpu_util");
    record.averages.avg_mem_used_mb = row.Number("avg_mem_used_mb");
    record.averages.avg_dsk_read_kbps = row.Number("avg_dsk_read_kbps");
    record.averages.avg_dsk_writ_kbps = row.Number("avg_dsk_writ_kbps");
    record.averages.avg_net_recv_kbps = row.Number("avg_net_recv_kbps");
    record.averages.avg_net_send_kbps = row.Number("avg_net_send_kbps");
    records.push_back(std::move(record));
  }
  return true;
}

} // namespace benchtel::compare
