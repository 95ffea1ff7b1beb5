#include "core/config/path_config.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

namespace benchtel::core::config {

PathConfig MakePathConfig(const fs::path& data_root) {
  PathConfig config;
  config.data_root = data_root;
  config.metrics_root = data_root / "metrics";
  config.sampled_root = data_root / "results" / "metrics";
  config.summary_csv = config.metrics_root / "summary.csv";
  config.summary_alt_csv = AlternateOutputPath(config.summary_csv);
  return config;
}

PathConfig ResolvePathConfig(const std::optional<fs::path>& data_root_override) {
  if (data_root_override.has_value() && !data_root_override->empty()) {
    return MakePathConfig(*data_root_override);
  }

  const char* raw = std::getenv(kDataRootEnvVar);
  if (raw != nullptr && raw[0] != '\0') {
    return MakePathConfig(fs::path(raw));
  }
  return MakePathConfig(fs::path(kDefaultDataRoot));
}

fs::path AlternateOutputPath(const fs::path& primary) {
  fs::path alternate = primary;
  alternate.replace_filename(primary.stem().string() + ".alt" + primary.extension().string());
  return alternate;
}

} // namespace benchtel::core::config
