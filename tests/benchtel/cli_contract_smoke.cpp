#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

int main() {
  using namespace benchtel::tests::common;

  AssertExitCode(DispatchArgs({"benchtel"}), 2, "no subcommand");
  AssertExitCode(DispatchArgs({"benchtel", "frobnicate"}), 2, "unknown subcommand");

  std::string captured;
  AssertExitCode(DispatchArgsCapturingStdout({"benchtel", "version"}, captured), 0, "version");
  AssertTrue(captured == "benchtel 0.1.0\n", "version output");
  AssertExitCode(DispatchArgs({"benchtel", "version", "extra"}), 2, "version with arguments");

  AssertExitCode(DispatchArgsCapturingStdout({"benchtel", "help"}, captured), 0, "help");
  AssertContains(captured, "benchtel sample --system <name> --dataset <name>");
  AssertContains(captured, "benchtel aggregate");
  AssertContains(captured, "benchtel compare");

  const fs::path root = CreateUniqueTempDir("benchtel-cli-contract-smoke");
  const std::string out_root = (root / "sampled").string();

  // sample: option validation happens before anything is launched or written.
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--dataset", "web-Google", "--out-root",
                               out_root, "--", "true"}),
                 2, "sample without --system");
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--out-root", out_root,
                               "--", "true"}),
                 2, "sample without --dataset");
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--dataset",
                               "web-Google", "--out-root", out_root}),
                 2, "sample without a command");
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--dataset",
                               "web-Google", "--out-root", out_root, "--interval", "fast", "--",
                               "true"}),
                 2, "non-numeric interval");
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--dataset",
                               "web-Google", "--out-root", out_root, "--interval", "-1", "--",
                               "true"}),
                 2, "negative interval");
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--dataset",
                               "web-Google", "--out-root", out_root, "--log-level", "loud", "--",
                               "true"}),
                 2, "unknown log level");
  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--dataset",
                               "web-Google", "--out-root", out_root, "--interval", "1e30", "--",
                               "true"}),
                 2, "interval beyond the ceiling");
  AssertTrue(!fs::exists(root / "sampled"), "rejected options write nothing");

  // Usage errors inside a subcommand repeat the usage text on stderr.
  std::string diagnostics;
  AssertExitCode(DispatchArgsCapturingStderr({"benchtel", "aggregate", "--bogus"}, diagnostics),
                 2, "aggregate unknown option");
  AssertContains(diagnostics, "error: unknown option: --bogus");
  AssertContains(diagnostics, "usage:");
  AssertContains(diagnostics, "benchtel aggregate [--data-root <dir>]");
  AssertExitCode(DispatchArgsCapturingStderr({"benchtel", "compare", "--wide"}, diagnostics), 2,
                 "compare unknown option");
  AssertContains(diagnostics, "usage:");
  AssertExitCode(DispatchArgsCapturingStderr({"benchtel", "capture", "/tmp", "job", "--fast",
                                              "--", "true"},
                                             diagnostics),
                 2, "capture unknown option");
  AssertContains(diagnostics, "usage:");
  AssertExitCode(DispatchArgsCapturingStderr({"benchtel", "sample", "--verbose"}, diagnostics), 2,
                 "sample unknown option");
  AssertContains(diagnostics, "usage:");

  AssertExitCode(DispatchArgs({"benchtel", "sample", "--system", "spark", "--dataset",
                               "web-Google", "--out-root", out_root, "--log-level", "error", "--",
                               "/nonexistent/benchtel-no-such-binary"}),
                 20, "sample launch failure");
  AssertTrue(!fs::exists(root / "sampled" / "spark" / "web-Google"),
             "launch failure writes nothing");

  // A failing child is reported in the summary but is not a sampler failure.
  AssertExitCode(DispatchArgsCapturingStdout({"benchtel", "sample", "--system", "spark",
                                              "--dataset", "web-Google", "--out-root", out_root,
                                              "--interval", "0.2", "--log-level", "error", "--",
                                              "sh", "-c", "exit 5"},
                                             captured),
                 0, "sample with failing child");
  const fs::path run_dir = root / "sampled" / "spark" / "web-Google";
  AssertContains(captured, "summary: " + (run_dir / "summary.json").string());
  AssertContains(captured, "timeseries: " + (run_dir / "timeseries.csv").string());
  AssertContains(ReadFileToString(run_dir / "summary.json"), "\"system\": \"spark\"");

  // aggregate / compare validation.
  AssertExitCode(DispatchArgs({"benchtel", "aggregate", "--jobs", "0"}), 2, "zero jobs");
  AssertExitCode(DispatchArgs({"benchtel", "aggregate", "--bogus"}), 2, "unknown option");
  AssertExitCode(DispatchArgs({"benchtel", "compare", "--summary",
                               (root / "missing.csv").string()}),
                 1, "compare without a summary table");
  AssertExitCode(DispatchArgs({"benchtel", "compare", "--left", ""}), 2, "empty framework");

  // compare over a table with no shared dataset.
  WriteFile(root / "table.csv",
            "framework,dataset,phase,elapsed_seconds\n"
            "spark,web-Google,job,10\n"
            "hadoop,email-EuAll,indegree,20\n");
  AssertExitCode(DispatchArgsCapturingStdout(
                     {"benchtel", "compare", "--summary", (root / "table.csv").string()},
                     captured),
                 0, "compare without overlap");
  AssertContains(captured, "no dataset has rows for both spark and hadoop");

  RemovePathBestEffort(root);
  return 0;
}
