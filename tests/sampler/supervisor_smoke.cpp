#include "artifacts/run_summary_json.hpp"
#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "sampler/supervisor.hpp"

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using benchtel::hostprobe::HostCounterSnapshot;

// Disk counters run backwards (device hot-unplug) while network counters grow,
// so the summary must clamp one delta and keep the other.
class ScriptedCounterSource final : public benchtel::hostprobe::HostCounterSource {
public:
  HostCounterSnapshot Read() override {
    ++reads_;
    HostCounterSnapshot snapshot;
    snapshot.cpu = benchtel::hostprobe::CpuTimes{reads_ * 50U, reads_ * 100U};
    snapshot.memory = benchtel::hostprobe::MemorySnapshot{8ULL << 30U, 6ULL << 30U};
    snapshot.disk = benchtel::hostprobe::DiskIoCounters{1'000'000'000ULL - reads_ * 4096U,
                                                        2'000'000'000ULL - reads_ * 4096U};
    snapshot.net = benchtel::hostprobe::NetIoCounters{reads_ * 1500U, reads_ * 3000U};
    return snapshot;
  }

private:
  std::uint64_t reads_ = 0;
};

std::vector<double> ReadTimeColumn(const fs::path& path) {
  std::istringstream input(benchtel::tests::common::ReadFileToString(path));
  std::string line;
  std::getline(input, line);
  benchtel::tests::common::AssertContains(line, "t_sec,cpu_percent");
  std::vector<double> times;
  while (std::getline(input, line)) {
    if (line.empty()) {
      continue;
    }
    times.push_back(std::stod(line.substr(0, line.find(','))));
  }
  return times;
}

} // namespace

int main() {
  using namespace benchtel::tests::common;
  using benchtel::sampler::SuperviseCommand;
  using benchtel::sampler::SupervisionFailure;
  using benchtel::sampler::SupervisionResult;

  const fs::path root = CreateUniqueTempDir("benchtel-supervisor-smoke");

  // Real host counters.
  {
    benchtel::sampler::SamplerOptions options;
    options.system = "spark";
    options.dataset = "web-Google";
    options.out_root = root / "platform";
    options.interval_seconds = 0.2;
    options.command = {"sleep", "1"};

    benchtel::hostprobe::PlatformCounterSource source;
    SupervisionResult result;
    std::string error;
    if (!SuperviseCommand(options, source, nullptr, result, error)) {
      Fail("SuperviseCommand failed: " + error);
    }
    AssertTrue(result.failure == SupervisionFailure::kNone, "unexpected failure kind");
    AssertExitCode(result.child_exit_code, 0, "sleep exit code");
    AssertTrue(result.output_dir == root / "platform" / "spark" / "web-Google",
               "output dir layout");
    // The clock starts before launch and stops at the first poll after exit, so
    // elapsed is at least the child's runtime and at most one interval past it.
    constexpr double kChildSeconds = 1.0;
    constexpr double kSchedulingSlack = 0.3;
    AssertTrue(result.summary.elapsed_sec >= kChildSeconds - 0.01,
               "elapsed should cover the child lifetime");
    AssertTrue(result.summary.elapsed_sec <= kChildSeconds + options.interval_seconds +
                                                 kSchedulingSlack,
               "elapsed should end within one interval of the child's exit");
    AssertTrue(result.summary.samples >= 2U, "expected several samples at 0.2s interval");
    AssertTrue(result.summary.end_epoch >= result.summary.start_epoch, "epoch ordering");
    AssertTrue(result.summary.disk_read_delta_bytes >= 0 &&
                   result.summary.disk_write_delta_bytes >= 0 &&
                   result.summary.net_sent_delta_bytes >= 0 &&
                   result.summary.net_recv_delta_bytes >= 0,
               "deltas are never negative");

    const std::vector<double> times = ReadTimeColumn(result.timeseries_path);
    AssertTrue(times.size() == result.summary.samples, "one timeseries row per sample");
    for (std::size_t i = 1; i < times.size(); ++i) {
      AssertTrue(times[i] >= times[i - 1], "t_sec must be non-decreasing");
    }

    benchtel::sampler::RunSummary loaded;
    if (!benchtel::artifacts::LoadRunSummaryJson(result.summary_path, loaded, error)) {
      Fail("LoadRunSummaryJson failed: " + error);
    }
    AssertTrue(loaded.system == "spark" && loaded.dataset == "web-Google", "labels round trip");
    AssertTrue(loaded.samples == result.summary.samples, "sample count round trip");
    AssertTrue(loaded.cmd == options.command, "command round trip");
    AssertNear(loaded.elapsed_sec, result.summary.elapsed_sec, 1e-3, "elapsed round trip");
  }

  // Scripted counters; non-zero child exit still produces a full summary.
  {
    benchtel::sampler::SamplerOptions options;
    options.system = "hadoop";
    options.dataset = "email-EuAll";
    options.out_root = root / "scripted";
    options.interval_seconds = 0.05;
    options.command = {"sh", "-c", "sleep 0.5; exit 4"};

    ScriptedCounterSource source;
    SupervisionResult result;
    std::string error;
    if (!SuperviseCommand(options, source, nullptr, result, error)) {
      Fail("SuperviseCommand failed: " + error);
    }
    AssertExitCode(result.child_exit_code, 4, "child exit code");
    AssertTrue(result.summary.disk_read_delta_bytes == 0, "disk read delta clamps to zero");
    AssertTrue(result.summary.disk_write_delta_bytes == 0, "disk write delta clamps to zero");
    AssertTrue(result.summary.net_sent_delta_bytes > 0, "net sent delta grows");
    AssertTrue(result.summary.net_recv_delta_bytes > result.summary.net_sent_delta_bytes,
               "net recv grows faster");
    AssertNear(result.summary.peak_cpu_percent, 50.0, 1e-9, "scripted cpu percent");
    AssertNear(result.summary.max_mem_used_mb, 2048.0, 1e-9, "scripted memory in MiB");
    // Interval is floored at 0.2s, so a 0.5s child yields a handful of samples.
    AssertTrue(result.summary.samples >= 2U && result.summary.samples <= 10U,
               "interval floor bounds the sample count");
  }

  RemovePathBestEffort(root);
  return 0;
}
