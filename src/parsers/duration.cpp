#include "parsers/duration.hpp"

#include "core/text_utils.hpp"

#include <vector>

namespace benchtel::parsers {

namespace {

std::vector<std::string_view> SplitOnColon(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t colon = text.find(':', start);
    if (colon == std::string_view::npos) {
      fields.push_back(core::Trim(text.substr(start)));
      return fields;
    }
    fields.push_back(core::Trim(text.substr(start, colon - start)));
    start = colon + 1U;
  }
}

} // namespace

std::optional<double> TryParseDurationSeconds(std::string_view token) {
  token = core::Trim(token);
  const std::vector<std::string_view> fields = SplitOnColon(token);

  if (fields.size() == 3U) {
    const auto hours = core::ParseInteger(fields[0]);
    const auto minutes = core::ParseInteger(fields[1]);
    const auto seconds = core::ParseDouble(fields[2]);
    if (!hours.has_value() || !minutes.has_value() || !seconds.has_value()) {
      return std::nullopt;
    }
    return static_cast<double>(*hours) * 3600.0 + static_cast<double>(*minutes) * 60.0 +
           *seconds;
  }

  if (fields.size() == 2U) {
    const auto minutes = core::ParseInteger(fields[0]);
    const auto seconds = core::ParseDouble(fields[1]);
    if (!minutes.has_value() || !seconds.has_value()) {
      return std::nullopt;
    }
    return static_cast<double>(*minutes) * 60.0 + *seconds;
  }

  if (fields.size() == 1U) {
    return core::ParseDouble(token);
  }
  return std::nullopt;
}

double ParseDurationSeconds(std::string_view token) {
  return TryParseDurationSeconds(token).value_or(0.0);
}

} // namespace benchtel::parsers
