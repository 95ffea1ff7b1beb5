#pragma once

#include "sampler/run_types.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace benchtel::artifacts {

inline constexpr const char* kTimeseriesFileName = "timeseries.csv";
inline constexpr const char* kTimeseriesHeader =
    "t_sec,cpu_percent,mem_used_mb,mem_percent,disk_read_bytes,disk_write_bytes,"
    "net_sent_bytes,net_recv_bytes";

// Streams samples to `timeseries.csv` as they are taken, flushing each row so
// an interrupted run still leaves every sample written so far.
//
// Columns: t_sec (3 decimals), cpu_percent/mem_used_mb/mem_percent (2 decimals),
// then the four cumulative byte counters as integers.
class TimeseriesCsvWriter {
public:
  bool Open(const std::filesystem::path& path, std::string& error);
  bool Append(const sampler::Sample& sample, std::string& error);
  bool Close(std::string& error);

  const std::filesystem::path& Path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::ofstream out_;
};

std::string FormatTimeseriesRow(const sampler::Sample& sample);

} // namespace benchtel::artifacts
