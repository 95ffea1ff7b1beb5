#include "parsers/sar_report.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using benchtel::parsers::ParseSarCpu;
using benchtel::parsers::ParseSarDisk;
using benchtel::parsers::ParseSarMemory;
using benchtel::parsers::ParseSarNetwork;
using benchtel::parsers::ReadSarReports;
using Catch::Matchers::WithinAbs;

TEST_CASE("sar CPU prefers the Average row", "[parsers][sar]") {
  const std::vector<std::string> lines = {
      "Linux 5.15.0-91-generic (node1) \t01/01/24 \t_x86_64_\t(8 CPU)",
      "",
      "12:00:01        CPU     %user     %nice   %system   %iowait    %steal     %idle",
      "12:00:02        all     50.00      0.00     10.00      0.00      0.00     40.00",
      "Average:        all    2.00   0.00   3.00   1.00   0.00  94.00",
  };
  REQUIRE(ParseSarCpu(lines).value() == 6.0);
}

TEST_CASE("sar CPU averages data rows without an Average row", "[parsers][sar]") {
  const std::vector<std::string> lines = {
      "Linux 5.15.0-91-generic (node1) \t01/01/24 \t_x86_64_\t(8 CPU)",
      "",
      "12:00:01        CPU     %user     %nice   %system   %iowait    %steal     %idle",
      "12:00:02        all      2.00      0.00      3.00      1.00      0.00     94.00",
      "12:00:03        all      6.00      0.00      3.00      1.00      0.00     90.00",
      "12:00:04        all      garbage",
  };
  REQUIRE_THAT(ParseSarCpu(lines).value(), WithinAbs(8.0, 1e-9));
}

TEST_CASE("sar memory converts used KB to MB", "[parsers][sar]") {
  REQUIRE(ParseSarMemory({"Average:     1000      2000      4096     50.00"}).value() == 4.0);

  const std::vector<std::string> rows = {
      "12:00:01    kbmemfree   kbavail kbmemused  %memused",
      "12:00:02         1000      2000      2048     10.00",
      "12:00:03         1000      2000      6144     30.00",
  };
  REQUIRE(ParseSarMemory(rows).value() == 4.0);
}

TEST_CASE("sar disk reads the last two columns", "[parsers][sar]") {
  const auto average =
      ParseSarDisk({"Average:      10.00      4.00      6.00    512.00   1024.00"});
  REQUIRE(average.first.value() == 512.0);
  REQUIRE(average.second.value() == 1024.0);

  const auto rows = ParseSarDisk({
      "12:00:01          tps      rtps      wtps   bread/s   bwrtn/s",
      "12:00:02         1.00      1.00      0.00    100.00     10.00",
      "12:00:03         1.00      1.00      0.00    300.00     30.00",
  });
  REQUIRE(rows.first.value() == 200.0);
  REQUIRE(rows.second.value() == 20.0);
}

TEST_CASE("sar network sums Average rows except loopback", "[parsers][sar]") {
  const std::vector<std::string> lines = {
      "Average:        IFACE   rxpck/s   txpck/s    rxkB/s    txkB/s   rxcmp/s   txcmp/s",
      "Average:           lo      1.00      1.00      9.00      9.00      0.00      0.00",
      "Average:         eth0      5.00      4.00      2.50      1.50      0.00      0.00",
      "Average:         eth1      1.00      1.00      0.50      0.25      0.00      0.00",
  };
  const auto network = ParseSarNetwork(lines);
  REQUIRE(network.first.value() == 3.0);
  REQUIRE(network.second.value() == 1.75);
}

TEST_CASE("sar network groups data rows by timestamp", "[parsers][sar]") {
  const std::vector<std::string> lines = {
      "12:00:01        IFACE   rxpck/s   txpck/s    rxkB/s    txkB/s   rxcmp/s   txcmp/s",
      "12:00:02           lo      1.00      1.00      9.00      9.00      0.00      0.00",
      "12:00:02         eth0      1.00      1.00      2.00      1.00      0.00      0.00",
      "12:00:02         eth1      1.00      1.00      1.00      1.00      0.00      0.00",
      "12:00:03         eth0      1.00      1.00      4.00      3.00      0.00      0.00",
  };
  const auto network = ParseSarNetwork(lines);
  REQUIRE(network.first.value() == 3.5);
  REQUIRE(network.second.value() == 2.5);
}

TEST_CASE("Empty or missing sar reports stay absent", "[parsers][sar]") {
  REQUIRE_FALSE(ParseSarCpu({}).has_value());
  REQUIRE_FALSE(ParseSarMemory({"Linux 5.15.0 (node1)"}).has_value());
  REQUIRE_FALSE(ParseSarDisk({}).first.has_value());
  REQUIRE_FALSE(ParseSarNetwork({}).second.has_value());

  benchtel::parsers::SarReportPaths paths;
  paths.cpu = "/nonexistent/benchtel/job.sar.cpu.txt";
  paths.memory = "/nonexistent/benchtel/job.sar.mem.txt";
  paths.disk = "/nonexistent/benchtel/job.sar.dsk.txt";
  paths.network = "/nonexistent/benchtel/job.sar.net.txt";
  REQUIRE(ReadSarReports(paths).AllAbsent());
}
