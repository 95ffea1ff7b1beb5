#include "hostprobe/host_counters.hpp"

#include "core/text_utils.hpp"
#include "hostprobe/host_counters_internal.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace benchtel::hostprobe {

namespace {

constexpr std::uint64_t kSectorBytes = 512;

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1U;
  }
  return lines;
}

std::optional<std::uint64_t> ParseCounter(std::string_view token) {
  const auto value = core::ParseInteger(token);
  if (!value.has_value() || *value < 0) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(*value);
}

// "MemTotal:       16318480 kB" -> bytes
std::optional<std::uint64_t> ParseMeminfoBytes(std::string_view line) {
  const auto parts = core::SplitWhitespace(line);
  if (parts.size() < 2U) {
    return std::nullopt;
  }
  const auto value = ParseCounter(parts[1]);
  if (!value.has_value()) {
    return std::nullopt;
  }
  const bool in_kb = parts.size() >= 3U && core::ToLower(parts[2]) == "kb";
  return in_kb ? *value * 1024U : *value;
}

} // namespace

HostCounterSnapshot PlatformCounterSource::Read() {
  return internal::ReadHostCountersPlatform();
}

double CpuPercentBetween(const CpuTimes& previous, const CpuTimes& current) {
  if (current.total <= previous.total || current.idle < previous.idle) {
    return 0.0;
  }
  const auto total_delta = static_cast<double>(current.total - previous.total);
  const auto idle_delta = static_cast<double>(current.idle - previous.idle);
  if (idle_delta >= total_delta) {
    return 0.0;
  }
  return (total_delta - idle_delta) / total_delta * 100.0;
}

std::optional<CpuTimes> ParseProcStat(std::string_view text) {
  for (const auto line : SplitLines(text)) {
    const auto parts = core::SplitWhitespace(line);
    if (parts.empty() || parts.front() != "cpu") {
      continue;
    }

    // cpu user nice system idle iowait irq softirq steal [guest guest_nice]
    // guest time is already folded into user/nice and is not added again.
    CpuTimes times;
    const std::size_t last = parts.size() < 9U ? parts.size() : 9U;
    if (last < 5U) {
      return std::nullopt;
    }
    for (std::size_t i = 1; i < last; ++i) {
      const auto value = ParseCounter(parts[i]);
      if (!value.has_value()) {
        return std::nullopt;
      }
      times.total += *value;
      if (i == 4U || i == 5U) {
        times.idle += *value;
      }
    }
    return times;
  }
  return std::nullopt;
}

std::optional<MemorySnapshot> ParseProcMeminfo(std::string_view text) {
  std::optional<std::uint64_t> total;
  std::optional<std::uint64_t> available;
  std::optional<std::uint64_t> free;
  std::optional<std::uint64_t> buffers;
  std::optional<std::uint64_t> cached;

  for (const auto line : SplitLines(text)) {
    if (core::StartsWith(line, "MemTotal:")) {
      total = ParseMeminfoBytes(line);
    } else if (core::StartsWith(line, "MemAvailable:")) {
      available = ParseMeminfoBytes(line);
    } else if (core::StartsWith(line, "MemFree:")) {
      free = ParseMeminfoBytes(line);
    } else if (core::StartsWith(line, "Buffers:")) {
      buffers = ParseMeminfoBytes(line);
    } else if (core::StartsWith(line, "Cached:")) {
      cached = ParseMeminfoBytes(line);
    }
  }

  if (!total.has_value()) {
    return std::nullopt;
  }

  MemorySnapshot snapshot;
  snapshot.total_bytes = *total;
  if (available.has_value()) {
    snapshot.available_bytes = *available;
  } else {
    // Kernels before 3.14 lack MemAvailable.
    snapshot.available_bytes = free.value_or(0) + buffers.value_or(0) + cached.value_or(0);
  }
  if (snapshot.available_bytes > snapshot.total_bytes) {
    snapshot.available_bytes = snapshot.total_bytes;
  }
  return snapshot;
}

std::optional<DiskIoCounters> ParseProcDiskstats(
    std::string_view text, const std::function<bool(std::string_view)>& is_whole_disk) {
  DiskIoCounters counters;
  bool any_device = false;
  for (const auto line : SplitLines(text)) {
    // major minor name reads merged sectors_read ms writes merged sectors_written ...
    const auto parts = core::SplitWhitespace(line);
    if (parts.size() < 10U) {
      continue;
    }
    if (is_whole_disk && !is_whole_disk(parts[2])) {
      continue;
    }
    const auto sectors_read = ParseCounter(parts[5]);
    const auto sectors_written = ParseCounter(parts[9]);
    if (!sectors_read.has_value() || !sectors_written.has_value()) {
      continue;
    }
    counters.read_bytes += *sectors_read * kSectorBytes;
    counters.write_bytes += *sectors_written * kSectorBytes;
    any_device = true;
  }
  if (!any_device) {
    return std::nullopt;
  }
  return counters;
}

std::optional<NetIoCounters> ParseProcNetDev(std::string_view text) {
  NetIoCounters counters;
  bool any_interface = false;
  for (const auto line : SplitLines(text)) {
    // "  eth0: rx_bytes rx_packets errs drop fifo frame compressed multicast tx_bytes ..."
    const std::size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    const auto fields = core::SplitWhitespace(line.substr(colon + 1U));
    if (fields.size() < 9U) {
      continue;
    }
    const auto recv = ParseCounter(fields[0]);
    const auto sent = ParseCounter(fields[8]);
    if (!recv.has_value() || !sent.has_value()) {
      continue;
    }
    counters.recv_bytes += *recv;
    counters.sent_bytes += *sent;
    any_interface = true;
  }
  if (!any_interface) {
    return std::nullopt;
  }
  return counters;
}

} // namespace benchtel::hostprobe
