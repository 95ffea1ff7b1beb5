#include "hostprobe/host_counters_internal.hpp"

#if defined(__linux__)

#include "core/fs_utils.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace benchtel::hostprobe::internal {

namespace {

std::string ReadProcFile(const char* path) {
  std::string contents;
  std::string error;
  if (!core::ReadTextFile(path, contents, error)) {
    return "";
  }
  return contents;
}

// Whole disks are listed under /sys/block; partitions are not. Device names
// containing '/' appear there with '!' instead.
bool IsWholeDisk(std::string_view name) {
  std::string sys_name(name);
  for (char& c : sys_name) {
    if (c == '/') {
      c = '!';
    }
  }
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::path("/sys/block") / sys_name, ec);
}

} // namespace

HostCounterSnapshot ReadHostCountersPlatform() {
  HostCounterSnapshot snapshot;
  snapshot.cpu = ParseProcStat(ReadProcFile("/proc/stat"));
  snapshot.memory = ParseProcMeminfo(ReadProcFile("/proc/meminfo"));
  snapshot.disk = ParseProcDiskstats(ReadProcFile("/proc/diskstats"), IsWholeDisk);
  snapshot.net = ParseProcNetDev(ReadProcFile("/proc/net/dev"));
  return snapshot;
}

} // namespace benchtel::hostprobe::internal

#endif
