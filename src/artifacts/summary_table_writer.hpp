#pragma once

#include "aggregate/metrics_record.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace benchtel::artifacts {

// Renders the canonical table: header row, then one row per record in the
// given order. Absent values are empty cells, reals use shortest round-trip
// text and max_rss_kb is an integer.
std::string RenderSummaryTable(const std::vector<aggregate::MetricsRecord>& records);

struct SummaryTableWriteOutcome {
  std::filesystem::path written_path;
  bool used_fallback = false;
  // Why the primary destination was rejected (set when used_fallback).
  std::string primary_error;
};

// Writes the table atomically to `primary`; if that fails, to `fallback`.
// Returns false only when both destinations fail.
bool WriteSummaryTable(const std::vector<aggregate::MetricsRecord>& records,
                       const std::filesystem::path& primary,
                       const std::filesystem::path& fallback, SummaryTableWriteOutcome& outcome,
                       std::string& error);

} // namespace benchtel::artifacts
