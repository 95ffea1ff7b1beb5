#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace benchtel::sampler {

// One timestamped host snapshot. `t_sec` is monotonic seconds since
// supervision start; byte counters are cumulative since boot.
struct Sample {
  double t_sec = 0.0;
  double cpu_percent = 0.0;
  double mem_used_mb = 0.0;
  double mem_percent = 0.0;
  std::uint64_t disk_read_bytes = 0;
  std::uint64_t disk_write_bytes = 0;
  std::uint64_t net_sent_bytes = 0;
  std::uint64_t net_recv_bytes = 0;
};

// Terminal record of one supervised run, written once after the child exits.
struct RunSummary {
  std::string system;
  std::string dataset;
  double start_epoch = 0.0;
  double end_epoch = 0.0;
  double elapsed_sec = 0.0;
  double peak_cpu_percent = 0.0;
  double max_mem_used_mb = 0.0;
  std::int64_t disk_read_delta_bytes = 0;
  std::int64_t disk_write_delta_bytes = 0;
  std::int64_t net_sent_delta_bytes = 0;
  std::int64_t net_recv_delta_bytes = 0;
  std::uint64_t samples = 0;
  std::vector<std::string> cmd;
};

} // namespace benchtel::sampler
