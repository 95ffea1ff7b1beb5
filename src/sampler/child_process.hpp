#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace benchtel::sampler {

// How to start one external command.
struct LaunchSpec {
  // argv[0] is resolved through PATH.
  std::vector<std::string> argv;
  // Redirect stdout to this file (created/truncated).
  std::optional<std::filesystem::path> stdout_path;
  // Send stdout and stderr to /dev/null (stdout_path wins for stdout).
  bool discard_output = false;
  // Variables set in the child's environment only.
  std::vector<std::pair<std::string, std::string>> env_overrides;
};

// Resource usage harvested from the kernel when the child is reaped.
struct ChildUsage {
  double user_cpu_seconds = 0.0;
  double system_cpu_seconds = 0.0;
  std::int64_t max_rss_kb = 0;
};

// Owns one launched child process. Liveness checks never block; the child is
// reaped exactly once, and a still-running child is killed and reaped when the
// owner goes away.
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;

  // Starts the command. Returns false (and leaves no child behind) when the
  // fork fails or the program cannot be executed; `error` names the cause.
  bool Launch(const LaunchSpec& spec, std::string& error);

  // Non-blocking liveness poll. Sets `running` and, once the child has exited,
  // records its status and usage.
  bool Poll(bool& running, std::string& error);

  // Blocks until the child exits.
  bool Wait(std::string& error);

  // Sends `signal_number` to a running child. Returns false when there is no
  // running child or delivery failed.
  bool Signal(int signal_number);

  bool Launched() const {
    return pid_ > 0;
  }

  bool Exited() const {
    return exited_;
  }

  pid_t Pid() const {
    return pid_;
  }

  // Exit status in shell convention: the exit code, or 128 + signal number.
  int ExitCode() const {
    return exit_code_;
  }

  const ChildUsage& Usage() const {
    return usage_;
  }

private:
  bool Reap(bool block, bool& reaped, std::string& error);
  void KillAndReap();

  pid_t pid_ = -1;
  bool exited_ = false;
  int exit_code_ = -1;
  ChildUsage usage_;
};

// True when `name` resolves to an executable file through PATH (or is itself
// an executable path).
bool IsCommandOnPath(const std::string& name);

} // namespace benchtel::sampler
