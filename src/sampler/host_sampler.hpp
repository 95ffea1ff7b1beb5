#pragma once

#include "core/logging/logger.hpp"
#include "hostprobe/host_counters.hpp"
#include "sampler/run_types.hpp"

#include <optional>

namespace benchtel::sampler {

// Turns raw counter snapshots into Samples. CPU percent is measured between
// consecutive reads, so the constructor primes the CPU baseline.
//
// A counter source the host cannot provide reports 0 for its fields and is
// logged once per sampler.
class HostSampler {
public:
  HostSampler(hostprobe::HostCounterSource& source, core::logging::Logger* logger);

  Sample Take(double t_sec);

  struct IoCounters {
    hostprobe::DiskIoCounters disk;
    hostprobe::NetIoCounters net;
  };

  // Current cumulative counters, used for run-start baselines and end-of-run
  // deltas. Unavailable counters read as 0.
  IoCounters ReadIoCounters();

private:
  void WarnOnce(bool& warned, std::string_view source_name);

  hostprobe::HostCounterSource& source_;
  core::logging::Logger* logger_ = nullptr;
  std::optional<hostprobe::CpuTimes> previous_cpu_;
  bool warned_cpu_ = false;
  bool warned_memory_ = false;
  bool warned_disk_ = false;
  bool warned_net_ = false;
};

} // namespace benchtel::sampler
