#include "core/flat_json.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace json = benchtel::core::json;

TEST_CASE("Flat JSON serializes fields in order with two-space indent", "[core][json]") {
  const std::vector<json::FlatField> fields = {
      {"system", std::string("spark")},
      {"elapsed_sec", 12.5},
      {"samples", std::int64_t{13}},
      {"cmd", std::vector<std::string>{"sleep", "1"}},
      {"note", json::FlatValue{}},
  };

  REQUIRE(json::ToPrettyJson(fields) ==
          "{\n"
          "  \"system\": \"spark\",\n"
          "  \"elapsed_sec\": 12.5,\n"
          "  \"samples\": 13,\n"
          "  \"cmd\": [\n"
          "    \"sleep\",\n"
          "    \"1\"\n"
          "  ],\n"
          "  \"note\": null\n"
          "}\n");
}

TEST_CASE("Flat JSON reader returns tagged values", "[core][json]") {
  json::FlatObject object;
  std::string error;
  REQUIRE(json::ParseFlatObject(R"({"a": 1, "b": -2.5, "c": "x\"y", "d": ["p", "q"], "e": null})",
                                object, error));

  REQUIRE(json::FindInteger(object, "a").value() == 1);
  REQUIRE(json::FindNumber(object, "a").value() == 1.0);
  REQUIRE(json::FindNumber(object, "b").value() == -2.5);
  REQUIRE_FALSE(json::FindInteger(object, "b").has_value());
  REQUIRE(json::FindString(object, "c").value() == "x\"y");
  REQUIRE(json::FindStringList(object, "d").value() == std::vector<std::string>{"p", "q"});
  REQUIRE_FALSE(json::FindNumber(object, "e").has_value());
  REQUIRE_FALSE(json::FindString(object, "missing").has_value());
}

TEST_CASE("Flat JSON reader rejects nested objects with a position", "[core][json]") {
  json::FlatObject object;
  std::string error;
  REQUIRE_FALSE(json::ParseFlatObject("{\n  \"a\": {\"b\": 1}\n}", object, error));
  REQUIRE(error.find("line 2") != std::string::npos);
  REQUIRE(error.find("nested objects") != std::string::npos);

  REQUIRE_FALSE(json::ParseFlatObject("{\"a\": 1", object, error));
  REQUIRE_FALSE(json::ParseFlatObject("{\"a\": 1} trailing", object, error));
}

TEST_CASE("Control bytes in strings survive a write and read back", "[core][json]") {
  const std::string argument = std::string("a\x01") + "b\x1f" + "\tc";
  REQUIRE(json::EscapeJson(argument) == "a\\u0001b\\u001f\\tc");

  const std::vector<json::FlatField> fields = {
      {"cmd", std::vector<std::string>{"printf", argument}},
  };
  json::FlatObject object;
  std::string error;
  REQUIRE(json::ParseFlatObject(json::ToPrettyJson(fields), object, error));
  REQUIRE(json::FindStringList(object, "cmd").value() ==
          std::vector<std::string>{"printf", argument});
}

TEST_CASE("Flat JSON reader decodes and validates \\u escapes", "[core][json]") {
  json::FlatObject object;
  std::string error;
  REQUIRE(json::ParseFlatObject(R"({"s": "\u0041\u00e9"})", object, error));
  REQUIRE(json::FindString(object, "s").value() == "A\xc3\xa9");

  REQUIRE_FALSE(json::ParseFlatObject(R"({"s": "\u00g1"})", object, error));
  REQUIRE(error.find("hex digit") != std::string::npos);
  REQUIRE_FALSE(json::ParseFlatObject(R"({"s": "\u12"})", object, error));
  REQUIRE_FALSE(json::ParseFlatObject(R"({"s": "\ud800"})", object, error));
}
