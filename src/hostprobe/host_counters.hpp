#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace benchtel::hostprobe {

// Aggregate CPU jiffies from the first `cpu` line of /proc/stat. iowait counts
// as idle so utilization reflects work actually scheduled on the CPUs.
struct CpuTimes {
  std::uint64_t idle = 0;
  std::uint64_t total = 0;
};

struct MemorySnapshot {
  std::uint64_t total_bytes = 0;
  std::uint64_t available_bytes = 0;
};

// Cumulative bytes since boot, summed over whole disks (partitions excluded).
struct DiskIoCounters {
  std::uint64_t read_bytes = 0;
  std::uint64_t write_bytes = 0;
};

// Cumulative bytes since boot, summed over every interface.
struct NetIoCounters {
  std::uint64_t sent_bytes = 0;
  std::uint64_t recv_bytes = 0;
};

// One read of every host-wide counter source. A source the platform cannot
// provide is left empty.
struct HostCounterSnapshot {
  std::optional<CpuTimes> cpu;
  std::optional<MemorySnapshot> memory;
  std::optional<DiskIoCounters> disk;
  std::optional<NetIoCounters> net;
};

// Seam between the sampler and the host. Production code uses the platform
// source; tests inject scripted snapshots.
class HostCounterSource {
public:
  virtual ~HostCounterSource() = default;

  // Best-effort read: unavailable sources stay empty and are not failures.
  virtual HostCounterSnapshot Read() = 0;
};

// Source backed by the running platform (procfs on Linux; empty elsewhere).
class PlatformCounterSource final : public HostCounterSource {
public:
  HostCounterSnapshot Read() override;
};

// Busy share of the interval between two CPU readings, in percent [0, 100].
// Returns 0 when no time elapsed or the counters went backwards.
double CpuPercentBetween(const CpuTimes& previous, const CpuTimes& current);

// Pure procfs text parsers, exposed for tests.
std::optional<CpuTimes> ParseProcStat(std::string_view text);
std::optional<MemorySnapshot> ParseProcMeminfo(std::string_view text);
std::optional<DiskIoCounters> ParseProcDiskstats(
    std::string_view text, const std::function<bool(std::string_view)>& is_whole_disk);
std::optional<NetIoCounters> ParseProcNetDev(std::string_view text);

} // namespace benchtel::hostprobe
