#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace benchtel::core::json {

// Value of one top-level field in a flat JSON record (run summaries).
// Alternatives, in index order: null, integer, real, string, list of strings.
using FlatValue =
    std::variant<std::monostate, std::int64_t, double, std::string, std::vector<std::string>>;

struct FlatField {
  std::string key;
  FlatValue value;
};

using FlatObject = std::map<std::string, FlatValue>;

std::string EscapeJson(std::string_view input);

// Serializes fields in the given order as a pretty-printed object with
// two-space indentation and a trailing newline. Reals use shortest round-trip
// formatting; non-finite reals serialize as null.
std::string ToPrettyJson(const std::vector<FlatField>& fields);

// Parses one JSON object whose values are scalars or arrays of strings. Nested
// objects, non-string array items and \u escapes are rejected with a
// line/column diagnostic.
bool ParseFlatObject(std::string_view input, FlatObject& object, std::string& error);

std::optional<double> FindNumber(const FlatObject& object, std::string_view key);
std::optional<std::int64_t> FindInteger(const FlatObject& object, std::string_view key);
std::optional<std::string> FindString(const FlatObject& object, std::string_view key);
std::optional<std::vector<std::string>> FindStringList(const FlatObject& object,
                                                       std::string_view key);

} // namespace benchtel::core::json
