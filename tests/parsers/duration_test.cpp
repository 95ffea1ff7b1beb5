#include "parsers/duration.hpp"

#include <catch2/catch.hpp>

using benchtel::parsers::ParseDurationSeconds;
using benchtel::parsers::TryParseDurationSeconds;

TEST_CASE("Duration parser accepts hour, minute and bare-second forms", "[parsers][duration]") {
  REQUIRE(ParseDurationSeconds("1:02:03") == 3723.0);
  REQUIRE(ParseDurationSeconds("0:05.50") == 5.5);
  REQUIRE(ParseDurationSeconds("12.25") == 12.25);
  REQUIRE(ParseDurationSeconds("2:00:00.5") == 7200.5);
  REQUIRE(ParseDurationSeconds(" 3:07.25 ") == 187.25);
}

TEST_CASE("Duration parser falls back to zero on unparsable text", "[parsers][duration]") {
  REQUIRE(ParseDurationSeconds("") == 0.0);
  REQUIRE(ParseDurationSeconds("soon") == 0.0);
  REQUIRE(ParseDurationSeconds("1:2:3:4") == 0.0);
  REQUIRE(ParseDurationSeconds("1.5:30") == 0.0);
  REQUIRE(ParseDurationSeconds("1:xx") == 0.0);
}

TEST_CASE("Try variant reports absence instead of zero", "[parsers][duration]") {
  REQUIRE_FALSE(TryParseDurationSeconds("garbage").has_value());
  REQUIRE_FALSE(TryParseDurationSeconds("").has_value());
  REQUIRE(TryParseDurationSeconds("0").value() == 0.0);
  REQUIRE(TryParseDurationSeconds("0:00.00").value() == 0.0);
}
