#pragma once

#include "sampler/run_types.hpp"

#include <filesystem>
#include <string>

namespace benchtel::artifacts {

inline constexpr const char* kRunSummaryFileName = "summary.json";

// Field order is fixed: system, dataset, start_epoch, end_epoch, elapsed_sec,
// peak_cpu_percent, max_mem_used_mb, the four *_delta_bytes counters, samples,
// cmd (array of strings).
std::string ToJson(const sampler::RunSummary& summary);

// Writes `<output_dir>/summary.json` atomically.
bool WriteRunSummaryJson(const sampler::RunSummary& summary,
                         const std::filesystem::path& output_dir,
                         std::filesystem::path& written_path, std::string& error);

// Loads a summary written by WriteRunSummaryJson. `elapsed_sec` is required;
// other numeric fields default to zero when missing.
bool LoadRunSummaryJson(const std::filesystem::path& path, sampler::RunSummary& summary,
                        std::string& error);

} // namespace benchtel::artifacts
