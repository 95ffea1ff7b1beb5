#include "sampler/supervisor.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <limits>

using namespace benchtel::sampler;

TEST_CASE("Sampling interval is floored and capped", "[sampler][interval]") {
  REQUIRE(EffectiveInterval(1.0) == 1.0);
  REQUIRE(EffectiveInterval(0.05) == kMinIntervalSeconds);
  REQUIRE(EffectiveInterval(0.0) == kMinIntervalSeconds);
  REQUIRE(EffectiveInterval(-3.0) == kMinIntervalSeconds);
  REQUIRE(EffectiveInterval(1e30) == kMaxIntervalSeconds);
  REQUIRE(EffectiveInterval(std::numeric_limits<double>::max()) == kMaxIntervalSeconds);
  REQUIRE(EffectiveInterval(std::numeric_limits<double>::infinity()) == kDefaultIntervalSeconds);
  REQUIRE(EffectiveInterval(std::numeric_limits<double>::quiet_NaN()) == kDefaultIntervalSeconds);
}

TEST_CASE("Capped interval converts to a positive steady-clock sleep", "[sampler][interval]") {
  const auto sleep = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(EffectiveInterval(1e30)));
  REQUIRE(sleep > std::chrono::steady_clock::duration::zero());
  REQUIRE(sleep == std::chrono::seconds(3600));
}

TEST_CASE("Run output directory nests system under dataset root", "[sampler]") {
  SamplerOptions options;
  options.out_root = "/data/results/metrics";
  options.system = "hadoop";
  options.dataset = "web-Google";
  REQUIRE(RunOutputDir(options) == std::filesystem::path("/data/results/metrics/hadoop/web-Google"));
}
