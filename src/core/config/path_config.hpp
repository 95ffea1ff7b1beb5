#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace benchtel::core::config {

inline constexpr const char* kDataRootEnvVar = "DATA_ROOT";
inline constexpr const char* kDefaultDataRoot = "/data";

// Every read/write root used by one command. Built once at command start and
// passed by const reference; nothing else consults the environment for paths.
struct PathConfig {
  std::filesystem::path data_root;
  // Tool-report layout: <metrics_root>/<framework>/<dataset>/<phase>.*
  std::filesystem::path metrics_root;
  // Sampler layout: <sampled_root>/<system>/<dataset>/{timeseries.csv,summary.json}
  std::filesystem::path sampled_root;
  std::filesystem::path summary_csv;
  std::filesystem::path summary_alt_csv;
};

// Derives all roots from one data root.
PathConfig MakePathConfig(const std::filesystem::path& data_root);

// Resolves the data root with precedence: explicit override, then the
// DATA_ROOT environment variable (ignored when empty), then `/data`.
PathConfig ResolvePathConfig(const std::optional<std::filesystem::path>& data_root_override);

// Fallback destination used when `primary` cannot be written:
// `summary.csv` -> `summary.alt.csv` beside it.
std::filesystem::path AlternateOutputPath(const std::filesystem::path& primary);

} // namespace benchtel::core::config
