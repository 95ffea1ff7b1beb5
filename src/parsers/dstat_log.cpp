#include "parsers/dstat_log.hpp"

#include "core/text_utils.hpp"
#include "parsers/csv_line.hpp"

#include <initializer_list>
#include <string_view>

namespace benchtel::parsers {

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

// Running sum for one logical column. `contributed` records that at least one
// cell parsed, independent of the value.
struct ColumnSum {
  double sum = 0.0;
  bool contributed = false;

  void Add(const std::vector<std::string>& row, const std::optional<std::size_t>& column) {
    if (!column.has_value() || *column >= row.size()) {
      return;
    }
    const auto value = core::ParseDouble(row[*column]);
    if (!value.has_value()) {
      return;
    }
    sum += *value;
    contributed = true;
  }
};

std::optional<std::size_t> FindColumn(const std::vector<std::string>& lowered_labels,
                                      std::initializer_list<std::string_view> candidates) {
  for (std::size_t i = 0; i < lowered_labels.size(); ++i) {
    for (const auto candidate : candidates) {
      if (lowered_labels[i].find(candidate) != std::string::npos) {
        return i;
      }
    }
  }
  return std::nullopt;
}

std::optional<double> RateAverage(const ColumnSum& column, std::uint64_t samples,
                                  ZeroRatePolicy policy) {
  if (policy == ZeroRatePolicy::kZeroSumIsAbsent) {
    if (column.sum == 0.0) {
      return std::nullopt;
    }
  } else if (!column.contributed) {
    return std::nullopt;
  }
  return column.sum / static_cast<double>(samples);
}

} // namespace

bool IsDstatHeaderRow(const std::vector<std::string>& row) {
  return !row.empty() && core::ToLower(core::Trim(row.front())) == "time";
}

DstatColumnMap ResolveDstatColumns(const std::vector<std::string>& header) {
  std::vector<std::string> labels;
  labels.reserve(header.size());
  for (const auto& cell : header) {
    labels.push_back(core::ToLower(core::Trim(cell)));
  }

  DstatColumnMap columns;
  columns.cpu_usr = FindColumn(labels, {"usr"});
  columns.cpu_sys = FindColumn(labels, {"sys"});
  columns.cpu_idl = FindColumn(labels, {"idl"});
  columns.mem_used = FindColumn(labels, {"used"});
  // Labels differ between dstat releases and plugin sets; the bare suffixes
  // catch the short single-row headers.
  columns.dsk_read = FindColumn(labels, {"io/total read", "dsk/total read", "read"});
  columns.dsk_writ = FindColumn(labels, {"io/total writ", "dsk/total writ", "writ"});
  columns.net_recv = FindColumn(labels, {"net/total recv", "recv"});
  columns.net_send = FindColumn(labels, {"net/total send", "send"});
  return columns;
}

DstatReadResult ParseDstatRows(const std::vector<std::vector<std::string>>& rows,
                               ZeroRatePolicy zero_rate_policy) {
  DstatReadResult result;

  std::optional<std::size_t> header_width;
  DstatColumnMap columns;
  bool block_has_samples = false;

  ColumnSum usr;
  ColumnSum sys;
  ColumnSum idl;
  ColumnSum mem_used;
  ColumnSum dsk_read;
  ColumnSum dsk_writ;
  ColumnSum net_recv;
  ColumnSum net_send;

  for (const auto& row : rows) {
    if (row.empty()) {
      continue;
    }

    if (IsDstatHeaderRow(row)) {
      // A new block re-resolves indices but keeps the running sums.
      header_width = row.size();
      columns = ResolveDstatColumns(row);
      ++result.header_blocks;
      block_has_samples = false;
      continue;
    }

    if (!header_width.has_value() || row.size() < *header_width) {
      continue;
    }

    ++result.samples;
    if (!block_has_samples) {
      block_has_samples = true;
      ++result.contributing_blocks;
    }
    usr.Add(row, columns.cpu_usr);
    sys.Add(row, columns.cpu_sys);
    idl.Add(row, columns.cpu_idl);
    mem_used.Add(row, columns.mem_used);
    dsk_read.Add(row, columns.dsk_read);
    dsk_writ.Add(row, columns.dsk_writ);
    net_recv.Add(row, columns.net_recv);
    net_send.Add(row, columns.net_send);
  }

  if (result.samples == 0U) {
    return result;
  }

  const auto samples = static_cast<double>(result.samples);
  DstatAverages& averages = result.averages;
  if (idl.contributed) {
    averages.avg_cpu_util = 100.0 - (idl.sum / samples);
  } else if (usr.contributed || sys.contributed) {
    averages.avg_cpu_util = (usr.sum + sys.sum) / samples;
  }
  if (mem_used.contributed) {
    averages.avg_mem_used_mb = (mem_used.sum / samples) / kBytesPerMiB;
  }
  averages.avg_dsk_read_kbps = RateAverage(dsk_read, result.samples, zero_rate_policy);
  averages.avg_dsk_writ_kbps = RateAverage(dsk_writ, result.samples, zero_rate_policy);
  averages.avg_net_recv_kbps = RateAverage(net_recv, result.samples, zero_rate_policy);
  averages.avg_net_send_kbps = RateAverage(net_send, result.samples, zero_rate_policy);
  return result;
}

DstatReadResult ReadDstatLog(const std::filesystem::path& path, ZeroRatePolicy zero_rate_policy) {
  return ParseDstatRows(ReadCsvRows(path), zero_rate_policy);
}

} // namespace benchtel::parsers
