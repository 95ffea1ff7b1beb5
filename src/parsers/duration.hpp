#pragma once

#include <optional>
#include <string_view>

namespace benchtel::parsers {

// Parses a wall-clock duration token into seconds.
//
// Accepted forms (fields split on ':', each field trimmed):
// - `H:MM:SS[.fraction]` -> H*3600 + MM*60 + SS
// - `MM:SS[.fraction]`   -> MM*60 + SS
// - bare decimal         -> itself
// Hour and minute fields must be integers. Returns nullopt for anything else.
std::optional<double> TryParseDurationSeconds(std::string_view token);

// Permissive variant kept for consumers that expect a number for every line:
// unparsable input yields 0.0.
double ParseDurationSeconds(std::string_view token);

} // namespace benchtel::parsers
