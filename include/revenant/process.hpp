#pragma once

// revenant/process.hpp — Ownership of one live prover process.
//
// A ProcessHandle owns the child pid and its three pipes. The child runs as a
// session leader, so signals and memory accounting address the whole process
// group (-pid). Handles are never reused: a restart destroys the handle and
// spawns a new one.
//
// SIGPIPE: the first spawn() sets SIGPIPE to SIG_IGN for the whole host
// process when it is still at SIG_DFL, so a write to a dead child fails with
// EPIPE. A handler or disposition installed by the host is left alone; a host
// that installs SIG_DFL later must expect to be killed by such writes.
//
// POSIX only.

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace revenant {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;
  // Overrides applied on top of the inherited environment.
  std::map<std::string, std::string> env;
  std::string cwd;
  // RLIMIT_AS ceiling for the child, 0 = unlimited.
  uint64_t memory_hard_limit_mb{0};
};

class ProcessHandle {
  struct Token {
    explicit Token() = default;
  };

 public:
  // Returns nullptr and fills *error when the process cannot be started
  // (pipe/fork failure, chdir failure, exec failure).
  static std::unique_ptr<ProcessHandle> spawn(const ProcessSpec& spec, std::string* error);

  explicit ProcessHandle(Token) {}
  ~ProcessHandle();
  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  pid_t pid() const { return pid_; }
  int stdin_fd() const { return in_fd_; }
  int stdout_fd() const { return out_fd_; }
  int stderr_fd() const { return err_fd_; }
  std::chrono::steady_clock::time_point started_at() const { return started_at_; }

  // Non-blocking liveness probe; reaps the child if it has exited.
  bool is_alive();

  // Exit code once reaped: WEXITSTATUS, or 128 + signal number.
  std::optional<int> exit_code() const { return exit_code_; }

  // Block up to `wait` for the child to exit on its own.
  std::optional<int> wait_exit(std::chrono::milliseconds wait);

  void close_stdin();

  // Close stdin, SIGTERM the process group, wait `grace`, then SIGKILL and
  // reap. Idempotent. Returns the exit code.
  int terminate(std::chrono::milliseconds grace);

 private:
  void close_fds();

  pid_t pid_{-1};
  int in_fd_{-1};
  int out_fd_{-1};
  int err_fd_{-1};
  std::optional<int> exit_code_;
  std::chrono::steady_clock::time_point started_at_{};
};

}  // namespace revenant
