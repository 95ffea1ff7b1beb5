#include "aggregate/run_layout.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <system_error>
#include <tuple>

namespace fs = std::filesystem;

namespace benchtel::aggregate {

namespace {

constexpr std::string_view kTimeSuffix = ".time";
constexpr std::string_view kDstatSuffix = ".dstat.csv";
constexpr std::array<std::string_view, 4> kSarSuffixes = {
    ".sar.cpu.txt",
    ".sar.mem.txt",
    ".sar.dsk.txt",
    ".sar.net.txt",
};

std::optional<std::string> StripSuffix(std::string_view name, std::string_view suffix) {
  if (name.size() <= suffix.size() || name.substr(name.size() - suffix.size()) != suffix) {
    return std::nullopt;
  }
  return std::string(name.substr(0, name.size() - suffix.size()));
}

bool ListDatasetPhases(const fs::path& dataset_dir, std::set<std::string>& phases,
                       std::string& error) {
  std::error_code ec;
  fs::directory_iterator it(dataset_dir, ec);
  if (ec) {
    error = "failed to list '" + dataset_dir.string() + "': " + ec.message();
    return false;
  }
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }
    if (auto phase = PhaseFromArtifactName(it->path().filename().string())) {
      phases.insert(std::move(*phase));
    }
  }
  if (ec) {
    error = "failed to list '" + dataset_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace

PhaseArtifacts PhaseArtifactsFor(const fs::path& dataset_dir, std::string_view phase) {
  const std::string base(phase);
  PhaseArtifacts artifacts;
  artifacts.time_report = dataset_dir / (base + std::string(kTimeSuffix));
  artifacts.dstat_csv = dataset_dir / (base + std::string(kDstatSuffix));
  artifacts.sar.cpu = dataset_dir / (base + std::string(kSarSuffixes[0]));
  artifacts.sar.memory = dataset_dir / (base + std::string(kSarSuffixes[1]));
  artifacts.sar.disk = dataset_dir / (base + std::string(kSarSuffixes[2]));
  artifacts.sar.network = dataset_dir / (base + std::string(kSarSuffixes[3]));
  return artifacts;
}

std::optional<std::string> PhaseFromArtifactName(std::string_view file_name) {
  if (auto phase = StripSuffix(file_name, kTimeSuffix)) {
    return phase;
  }
  if (auto phase = StripSuffix(file_name, kDstatSuffix)) {
    return phase;
  }
  for (const auto suffix : kSarSuffixes) {
    if (auto phase = StripSuffix(file_name, suffix)) {
      return phase;
    }
  }
  return std::nullopt;
}

PhaseRegistry DefaultPhaseRegistry() {
  return {
      {"spark", {"job"}},
      {"hadoop", {"indegree", "distribution"}},
  };
}

bool ListSubdirectories(const fs::path& dir, std::vector<std::string>& names, std::string& error) {
  names.clear();
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return true;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = "failed to list '" + dir.string() + "': " + ec.message();
    return false;
  }
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (it->is_directory(type_ec) && !type_ec) {
      names.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    error = "failed to list '" + dir.string() + "': " + ec.message();
    return false;
  }
  std::sort(names.begin(), names.end());
  return true;
}

bool DiscoverRunTriples(const fs::path& metrics_root, const PhaseRegistry& registry,
                        std::vector<RunTriple>& triples, std::string& error) {
  triples.clear();

  std::vector<std::string> frameworks;
  if (!ListSubdirectories(metrics_root, frameworks, error)) {
    return false;
  }

  for (const auto& framework : frameworks) {
    const fs::path framework_dir = metrics_root / framework;
    std::vector<std::string> datasets;
    if (!ListSubdirectories(framework_dir, datasets, error)) {
      return false;
    }

    const auto registered = registry.find(framework);
    for (const auto& dataset : datasets) {
      const fs::path dataset_dir = framework_dir / dataset;
      std::set<std::string> phases;
      if (registered != registry.end()) {
        phases.insert(registered->second.begin(), registered->second.end());
      }
      if (!ListDatasetPhases(dataset_dir, phases, error)) {
        return false;
      }
      for (const auto& phase : phases) {
        triples.push_back(RunTriple{framework, dataset, phase, dataset_dir});
      }
    }
  }

  std::sort(triples.begin(), triples.end(), [](const RunTriple& lhs, const RunTriple& rhs) {
    return std::tie(lhs.framework, lhs.dataset, lhs.phase) <
           std::tie(rhs.framework, rhs.dataset, rhs.phase);
  });
  return true;
}

} // namespace benchtel::aggregate
