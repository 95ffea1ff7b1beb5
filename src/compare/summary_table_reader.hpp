#pragma once

#include "aggregate/metrics_record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace benchtel::compare {

// Reads a canonical summary table back into records. Columns are located by
// header name, so extra or reordered columns are tolerated; empty or
// unparsable cells are absent. Requires framework, dataset and phase columns.
bool ReadSummaryTable(const std::filesystem::path& path,
                      std::vector<aggregate::MetricsRecord>& records, std::string& error);

} // namespace benchtel::compare
