#include "sampler/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace benchtel::sampler {

namespace {

double TimevalSeconds(const timeval& value) {
  return static_cast<double>(value.tv_sec) + static_cast<double>(value.tv_usec) / 1'000'000.0;
}

int DecodeExitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Runs in the forked child: only async-signal-safe calls until exec.
[[noreturn]] void ExecChild(const LaunchSpec& spec, char* const* argv, int error_fd) {
  const int null_fd = spec.discard_output ? ::open("/dev/null", O_WRONLY) : -1;
  if (null_fd >= 0) {
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
  }
  if (spec.stdout_path.has_value()) {
    const int out_fd = ::open(spec.stdout_path->c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (out_fd < 0) {
      const int err = errno;
      (void)!::write(error_fd, &err, sizeof(err));
      ::_exit(127);
    }
    ::dup2(out_fd, STDOUT_FILENO);
  }
  for (const auto& [key, value] : spec.env_overrides) {
    ::setenv(key.c_str(), value.c_str(), 1);
  }

  ::execvp(argv[0], argv);
  const int err = errno;
  (void)!::write(error_fd, &err, sizeof(err));
  ::_exit(127);
}

} // namespace

ChildProcess::~ChildProcess() {
  KillAndReap();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), exited_(other.exited_), exit_code_(other.exit_code_),
      usage_(other.usage_) {
  other.pid_ = -1;
  other.exited_ = false;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    KillAndReap();
    pid_ = other.pid_;
    exited_ = other.exited_;
    exit_code_ = other.exit_code_;
    usage_ = other.usage_;
    other.pid_ = -1;
    other.exited_ = false;
  }
  return *this;
}

bool ChildProcess::Launch(const LaunchSpec& spec, std::string& error) {
  if (Launched()) {
    error = "child process already launched";
    return false;
  }
  if (spec.argv.empty() || spec.argv.front().empty()) {
    error = "command cannot be empty";
    return false;
  }

  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1U);
  for (const auto& arg : spec.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  // The write end closes on a successful exec, so a zero-byte read means the
  // program is running; otherwise the child reports errno before exiting.
  int error_pipe[2] = {-1, -1};
  if (::pipe2(error_pipe, O_CLOEXEC) != 0) {
    error = std::string("failed to create launch pipe: ") + std::strerror(errno);
    return false;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    ::close(error_pipe[0]);
    ::close(error_pipe[1]);
    error = std::string("failed to fork: ") + std::strerror(err);
    return false;
  }
  if (pid == 0) {
    ::close(error_pipe[0]);
    ExecChild(spec, argv.data(), error_pipe[1]);
  }

  ::close(error_pipe[1]);
  int child_errno = 0;
  ssize_t read_bytes = 0;
  do {
    read_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
  } while (read_bytes < 0 && errno == EINTR);
  ::close(error_pipe[0]);

  if (read_bytes > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    error = "failed to launch '" + spec.argv.front() + "': " + std::strerror(child_errno);
    return false;
  }

  pid_ = pid;
  exited_ = false;
  exit_code_ = -1;
  usage_ = ChildUsage{};
  return true;
}

bool ChildProcess::Reap(bool block, bool& reaped, std::string& error) {
  reaped = false;
  if (!Launched()) {
    error = "no child process to wait for";
    return false;
  }
  if (exited_) {
    reaped = true;
    return true;
  }

  int status = 0;
  rusage usage{};
  pid_t result = -1;
  do {
    result = ::wait4(pid_, &status, block ? 0 : WNOHANG, &usage);
  } while (result < 0 && errno == EINTR);

  if (result < 0) {
    error = std::string("failed to wait for child process: ") + std::strerror(errno);
    return false;
  }
  if (result == 0) {
    return true;
  }

  exited_ = true;
  exit_code_ = DecodeExitStatus(status);
  usage_.user_cpu_seconds = TimevalSeconds(usage.ru_utime);
  usage_.system_cpu_seconds = TimevalSeconds(usage.ru_stime);
  // Linux reports ru_maxrss in kilobytes.
  usage_.max_rss_kb = static_cast<std::int64_t>(usage.ru_maxrss);
  reaped = true;
  return true;
}

bool ChildProcess::Poll(bool& running, std::string& error) {
  bool reaped = false;
  if (!Reap(/*block=*/false, reaped, error)) {
    return false;
  }
  running = !reaped;
  return true;
}

bool ChildProcess::Wait(std::string& error) {
  bool reaped = false;
  return Reap(/*block=*/true, reaped, error);
}

bool ChildProcess::Signal(int signal_number) {
  if (!Launched() || exited_) {
    return false;
  }
  return ::kill(pid_, signal_number) == 0;
}

void ChildProcess::KillAndReap() {
  if (!Launched() || exited_) {
    return;
  }
  (void)::kill(pid_, SIGKILL);
  std::string ignored;
  (void)Wait(ignored);
}

bool IsCommandOnPath(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    return ::access(name.c_str(), X_OK) == 0;
  }

  const char* raw_path = std::getenv("PATH");
  const std::string_view search_path = raw_path != nullptr ? raw_path : "/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= search_path.size()) {
    std::size_t end = search_path.find(':', start);
    if (end == std::string_view::npos) {
      end = search_path.size();
    }
    std::string dir(search_path.substr(start, end - start));
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    struct stat info{};
    if (::stat(candidate.c_str(), &info) == 0 && S_ISREG(info.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
    start = end + 1U;
  }
  return false;
}

} // namespace benchtel::sampler
