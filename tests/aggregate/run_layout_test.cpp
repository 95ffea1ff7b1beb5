#include "aggregate/run_layout.hpp"

#include <catch2/catch.hpp>

#include <filesystem>

using namespace benchtel::aggregate;

TEST_CASE("Artifact names map back to their phase", "[aggregate][layout]") {
  REQUIRE(PhaseFromArtifactName("job.time").value() == "job");
  REQUIRE(PhaseFromArtifactName("indegree.dstat.csv").value() == "indegree");
  REQUIRE(PhaseFromArtifactName("distribution.sar.net.txt").value() == "distribution");
  REQUIRE_FALSE(PhaseFromArtifactName("job.status").has_value());
  REQUIRE_FALSE(PhaseFromArtifactName(".time").has_value());
  REQUIRE_FALSE(PhaseFromArtifactName("job.sar.gpu.txt").has_value());
}

TEST_CASE("Phase artifacts sit beside each other in the dataset directory",
          "[aggregate][layout]") {
  const auto artifacts = PhaseArtifactsFor("/data/metrics/hadoop/web-Google", "indegree");
  REQUIRE(artifacts.time_report ==
          std::filesystem::path("/data/metrics/hadoop/web-Google/indegree.time"));
  REQUIRE(artifacts.dstat_csv ==
          std::filesystem::path("/data/metrics/hadoop/web-Google/indegree.dstat.csv"));
  REQUIRE(artifacts.sar.memory ==
          std::filesystem::path("/data/metrics/hadoop/web-Google/indegree.sar.mem.txt"));
}

TEST_CASE("Default registry knows both frameworks' phase sets", "[aggregate][layout]") {
  const auto registry = DefaultPhaseRegistry();
  REQUIRE(registry.at("spark") == std::vector<std::string>{"job"});
  REQUIRE(registry.at("hadoop") == std::vector<std::string>{"indegree", "distribution"});
}

TEST_CASE("Missing metrics root discovers nothing", "[aggregate][layout]") {
  std::vector<RunTriple> triples;
  std::string error;
  REQUIRE(DiscoverRunTriples("/nonexistent/benchtel/metrics", DefaultPhaseRegistry(), triples,
                             error));
  REQUIRE(triples.empty());
}
