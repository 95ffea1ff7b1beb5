#pragma once

#include "parsers/sar_report.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benchtel::aggregate {

// Tool artifacts of one phase inside a dataset directory:
//   <phase>.time, <phase>.dstat.csv, <phase>.sar.{cpu,mem,dsk,net}.txt
struct PhaseArtifacts {
  std::filesystem::path time_report;
  std::filesystem::path dstat_csv;
  parsers::SarReportPaths sar;
};

PhaseArtifacts PhaseArtifactsFor(const std::filesystem::path& dataset_dir, std::string_view phase);

// Phase named by an artifact file name, e.g. `indegree.sar.cpu.txt` ->
// `indegree`. Other files (status files, summaries) yield nullopt.
std::optional<std::string> PhaseFromArtifactName(std::string_view file_name);

// Registered phases per framework. A registered phase yields a row even when
// none of its files exist.
using PhaseRegistry = std::map<std::string, std::vector<std::string>>;

PhaseRegistry DefaultPhaseRegistry();

struct RunTriple {
  std::string framework;
  std::string dataset;
  std::string phase;
  std::filesystem::path dataset_dir;
};

// Walks <metrics_root>/<framework>/<dataset>/ and returns every triple, sorted
// by (framework, dataset, phase). A missing root yields no triples; an
// unreadable directory is an error.
bool DiscoverRunTriples(const std::filesystem::path& metrics_root, const PhaseRegistry& registry,
                        std::vector<RunTriple>& triples, std::string& error);

// Immediate sub-directory names of `dir`, sorted. Missing dir -> empty.
bool ListSubdirectories(const std::filesystem::path& dir, std::vector<std::string>& names,
                        std::string& error);

} // namespace benchtel::aggregate
