#include "artifacts/run_summary_json.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/flat_json.hpp"
#include "core/fs_utils.hpp"

#include <cstdint>
#include <vector>

namespace fs = std::filesystem;

namespace benchtel::artifacts {

std::string ToJson(const sampler::RunSummary& summary) {
  using core::json::FlatField;
  const std::vector<FlatField> fields = {
      {"system", summary.system},
      {"dataset", summary.dataset},
      {"start_epoch", summary.start_epoch},
      {"end_epoch", summary.end_epoch},
      {"elapsed_sec", summary.elapsed_sec},
      {"peak_cpu_percent", summary.peak_cpu_percent},
      {"max_mem_used_mb", summary.max_mem_used_mb},
      {"disk_read_delta_bytes", summary.disk_read_delta_bytes},
      {"disk_write_delta_bytes", summary.disk_write_delta_bytes},
      {"net_sent_delta_bytes", summary.net_sent_delta_bytes},
      {"net_recv_delta_bytes", summary.net_recv_delta_bytes},
      {"samples", static_cast<std::int64_t>(summary.samples)},
      {"cmd", summary.cmd},
  };
  return core::json::ToPrettyJson(fields);
}

bool WriteRunSummaryJson(const sampler::RunSummary& summary, const fs::path& output_dir,
                         fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / kRunSummaryFileName;
  return core::WriteTextFileAtomic(written_path, ToJson(summary), error);
}

bool LoadRunSummaryJson(const fs::path& path, sampler::RunSummary& summary, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }

  core::json::FlatObject object;
  if (!core::json::ParseFlatObject(text, object, error)) {
    error = "invalid run summary '" + path.string() + "': " + error;
    return false;
  }

  const auto elapsed = core::json::FindNumber(object, "elapsed_sec");
  if (!elapsed.has_value()) {
    error = "run summary '" + path.string() + "' is missing numeric field 'elapsed_sec'";
    return false;
  }

  summary = sampler::RunSummary{};
  summary.system = core::json::FindString(object, "system").value_or("");
  summary.dataset = core::json::FindString(object, "dataset").value_or("");
  summary.start_epoch = core::json::FindNumber(object, "start_epoch").value_or(0.0);
  summary.end_epoch = core::json::FindNumber(object, "end_epoch").value_or(0.0);
  summary.elapsed_sec = *elapsed;
  summary.peak_cpu_percent = core::json::FindNumber(object, "peak_cpu_percent").value_or(0.0);
  summary.max_mem_used_mb = core::json::FindNumber(object, "max_mem_used_mb").value_or(0.0);
  summary.disk_read_delta_bytes =
      core::json::FindInteger(object, "disk_read_delta_bytes").value_or(0);
  summary.disk_write_delta_bytes =
      core::json::FindInteger(object, "disk_write_delta_bytes").value_or(0);
  summary.net_sent_delta_bytes =
      core::json::FindInteger(object, "net_sent_delta_bytes").value_or(0);
  summary.net_recv_delta_bytes =
      core::json::FindInteger(object, "net_recv_delta_bytes").value_or(0);
  const auto samples = core::json::FindInteger(object, "samples").value_or(0);
  summary.samples = samples > 0 ? static_cast<std::uint64_t>(samples) : 0U;
  summary.cmd = core::json::FindStringList(object, "cmd").value_or(std::vector<std::string>{});
  return true;
}

} // namespace benchtel::artifacts
