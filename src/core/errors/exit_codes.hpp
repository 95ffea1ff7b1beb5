#pragma once

namespace benchtel::core::errors {

// Stable process-exit contract for scripted benchmark pipelines.
//
// The first three values keep their conventional shell meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The rest classify the failures wrappers most often need to branch on.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kLaunchFailed = 20,
  kOutputUnwritable = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace benchtel::core::errors
