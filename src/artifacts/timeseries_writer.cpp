#include "artifacts/timeseries_writer.hpp"

#include "core/text_utils.hpp"

namespace benchtel::artifacts {

std::string FormatTimeseriesRow(const sampler::Sample& sample) {
  std::string row;
  row += core::FormatFixedDouble(sample.t_sec, 3);
  row += ',';
  row += core::FormatFixedDouble(sample.cpu_percent, 2);
  row += ',';
  row += core::FormatFixedDouble(sample.mem_used_mb, 2);
  row += ',';
  row += core::FormatFixedDouble(sample.mem_percent, 2);
  row += ',';
  row += std::to_string(sample.disk_read_bytes);
  row += ',';
  row += std::to_string(sample.disk_write_bytes);
  row += ',';
  row += std::to_string(sample.net_sent_bytes);
  row += ',';
  row += std::to_string(sample.net_recv_bytes);
  return row;
}

bool TimeseriesCsvWriter::Open(const std::filesystem::path& path, std::string& error) {
  path_ = path;
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    error = "failed to open output file '" + path_.string() + "' for writing";
    return false;
  }
  out_ << kTimeseriesHeader << '\n';
  out_.flush();
  if (!out_) {
    error = "failed while writing output file '" + path_.string() + "'";
    return false;
  }
  return true;
}

bool TimeseriesCsvWriter::Append(const sampler::Sample& sample, std::string& error) {
  out_ << FormatTimeseriesRow(sample) << '\n';
  out_.flush();
  if (!out_) {
    error = "failed while writing output file '" + path_.string() + "'";
    return false;
  }
  return true;
}

bool TimeseriesCsvWriter::Close(std::string& error) {
  if (!out_.is_open()) {
    return true;
  }
  out_.close();
  if (out_.fail()) {
    error = "failed to close output file '" + path_.string() + "'";
    return false;
  }
  return true;
}

} // namespace benchtel::artifacts
