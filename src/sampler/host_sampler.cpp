#include "sampler/host_sampler.hpp"

#include <string>

namespace benchtel::sampler {

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

} // namespace

HostSampler::HostSampler(hostprobe::HostCounterSource& source, core::logging::Logger* logger)
    : source_(source), logger_(logger) {
  previous_cpu_ = source_.Read().cpu;
}

Sample HostSampler::Take(double t_sec) {
  const hostprobe::HostCounterSnapshot snapshot = source_.Read();

  Sample sample;
  sample.t_sec = t_sec;

  if (snapshot.cpu.has_value()) {
    if (previous_cpu_.has_value()) {
      sample.cpu_percent = hostprobe::CpuPercentBetween(*previous_cpu_, *snapshot.cpu);
    }
    previous_cpu_ = snapshot.cpu;
  } else {
    WarnOnce(warned_cpu_, "cpu");
  }

  if (snapshot.memory.has_value() && snapshot.memory->total_bytes > 0U) {
    const std::uint64_t used = snapshot.memory->total_bytes - snapshot.memory->available_bytes;
    sample.mem_used_mb = static_cast<double>(used) / kBytesPerMiB;
    sample.mem_percent = static_cast<double>(used) /
                         static_cast<double>(snapshot.memory->total_bytes) * 100.0;
  } else {
    WarnOnce(warned_memory_, "memory");
  }

  if (snapshot.disk.has_value()) {
    sample.disk_read_bytes = snapshot.disk->read_bytes;
    sample.disk_write_bytes = snapshot.disk->write_bytes;
  } else {
    WarnOnce(warned_disk_, "disk");
  }

  if (snapshot.net.has_value()) {
    sample.net_sent_bytes = snapshot.net->sent_bytes;
    sample.net_recv_bytes = snapshot.net->recv_bytes;
  } else {
    WarnOnce(warned_net_, "network");
  }

  return sample;
}

HostSampler::IoCounters HostSampler::ReadIoCounters() {
  const hostprobe::HostCounterSnapshot snapshot = source_.Read();
  IoCounters counters;
  counters.disk = snapshot.disk.value_or(hostprobe::DiskIoCounters{});
  counters.net = snapshot.net.value_or(hostprobe::NetIoCounters{});
  return counters;
}

void HostSampler::WarnOnce(bool& warned, std::string_view source_name) {
  if (warned) {
    return;
  }
  warned = true;
  if (logger_ != nullptr) {
    logger_->Warn("host counter source unavailable; reporting zero",
                  {{"source", source_name}});
  }
}

} // namespace benchtel::sampler
