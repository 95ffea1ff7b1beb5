#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "sampler/supervisor.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using namespace benchtel::tests::common;

  const fs::path root = CreateUniqueTempDir("benchtel-launch-failure-smoke");

  benchtel::sampler::SamplerOptions options;
  options.system = "spark";
  options.dataset = "web-Google";
  options.out_root = root / "out";
  options.command = {"/nonexistent/benchtel-no-such-binary", "--flag"};

  std::ostringstream log_stream;
  benchtel::core::logging::Logger logger(benchtel::core::logging::LogLevel::kDebug, log_stream);
  benchtel::hostprobe::PlatformCounterSource source;
  benchtel::sampler::SupervisionResult result;
  std::string error;
  AssertTrue(!benchtel::sampler::SuperviseCommand(options, source, &logger, result, error),
             "launch of a missing binary must fail");
  AssertTrue(result.failure == benchtel::sampler::SupervisionFailure::kLaunchFailed,
             "failure kind should be kLaunchFailed");
  AssertTrue(!error.empty(), "launch failure should carry an error message");
  AssertTrue(!fs::exists(root / "out"), "no output directory after a launch failure");
  AssertContains(log_stream.str(), "failed to launch supervised command");

  // Missing labels are rejected before anything runs.
  options.command = {"true"};
  options.dataset.clear();
  AssertTrue(!benchtel::sampler::SuperviseCommand(options, source, nullptr, result, error),
             "missing dataset must be rejected");
  AssertTrue(result.failure == benchtel::sampler::SupervisionFailure::kInvalidOptions,
             "failure kind should be kInvalidOptions");
  AssertTrue(!fs::exists(root / "out"), "no output directory for invalid options");

  RemovePathBestEffort(root);
  return 0;
}
