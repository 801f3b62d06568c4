#ifndef _WIN32

#include "revenant/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

extern char** environ;

namespace revenant {

namespace {

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

void set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Writes to a dead child must surface as EPIPE, not kill the host.
void ignore_sigpipe_once() {
  static std::once_flag once;
  std::call_once(once, [] {
    struct sigaction current;
    if (sigaction(SIGPIPE, nullptr, &current) != 0) return;
    if (!(current.sa_flags & SA_SIGINFO) && current.sa_handler == SIG_DFL) signal(SIGPIPE, SIG_IGN);
  });
}

void close_pair(int p[2]) {
  if (p[0] >= 0) close(p[0]);
  if (p[1] >= 0) close(p[1]);
  p[0] = p[1] = -1;
}

}  // namespace

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const ProcessSpec& spec, std::string* error) {
  ignore_sigpipe_once();

  // Everything the child needs is built before fork(); only async-signal-safe
  // calls happen between fork() and exec.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::map<std::string, std::string> merged;
  for (char** e = environ; e && *e; ++e) {
    const char* eq = std::strchr(*e, '=');
    if (!eq) continue;
    merged[std::string(*e, static_cast<size_t>(eq - *e))] = eq + 1;
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> envs;
  envs.reserve(merged.size());
  for (const auto& [k, v] : merged) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  struct rlimit mem_limit {};
  const bool limit_memory = spec.memory_hard_limit_mb > 0;
  if (limit_memory) {
    mem_limit.rlim_cur = static_cast<rlim_t>(spec.memory_hard_limit_mb) * 1024u * 1024u;
    mem_limit.rlim_max = mem_limit.rlim_cur;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
      pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
    if (error) *error = std::string("pipe: ") + std::strerror(errno);
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(status_pipe);
    return nullptr;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    if (error) *error = std::string("fork: ") + std::strerror(errno);
    close_pair(in_pipe);
    close_pair(out_pipe);
    close_pair(err_pipe);
    close_pair(status_pipe);
    return nullptr;
  }

  if (pid == 0) {
    setsid();
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    int child_errno = 0;
    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
      child_errno = errno;
    } else {
      if (limit_memory) setrlimit(RLIMIT_AS, &mem_limit);
      execvpe(argv[0], argv.data(), envp.data());
      child_errno = errno;
    }
    // Report the failure through the CLOEXEC status pipe.
    ssize_t ignored = write(status_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    _exit(127);
  }

  close(in_pipe[0]);
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(status_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(err_pipe[0]);
    if (error) *error = "exec " + spec.command + ": " + std::strerror(child_errno);
    return nullptr;
  }

  auto handle = std::make_unique<ProcessHandle>(Token{});
  handle->pid_ = pid;
  handle->in_fd_ = in_pipe[1];
  handle->out_fd_ = out_pipe[0];
  handle->err_fd_ = err_pipe[0];
  handle->started_at_ = std::chrono::steady_clock::now();
  set_nonblocking(handle->in_fd_);
  set_nonblocking(handle->out_fd_);
  set_nonblocking(handle->err_fd_);
  return handle;
}

ProcessHandle::~ProcessHandle() {
  terminate(std::chrono::milliseconds(0));
}

bool ProcessHandle::is_alive() {
  if (exit_code_ || pid_ <= 0) return false;
  int status = 0;
  const pid_t w = waitpid(pid_, &status, WNOHANG);
  if (w == pid_) {
    exit_code_ = decode_status(status);
    return false;
  }
  return w == 0;
}

std::optional<int> ProcessHandle::wait_exit(std::chrono::milliseconds wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait;
  while (is_alive()) {
    if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return exit_code_;
}

void ProcessHandle::close_stdin() {
  if (in_fd_ >= 0) {
    close(in_fd_);
    in_fd_ = -1;
  }
}

void ProcessHandle::close_fds() {
  close_stdin();
  if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
  if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

int ProcessHandle::terminate(std::chrono::milliseconds grace) {
  if (pid_ <= 0) return exit_code_.value_or(-1);
  close_stdin();
  if (is_alive()) {
    kill(-pid_, SIGTERM);
    kill(pid_, SIGTERM);
    if (!wait_exit(grace)) {
      kill(-pid_, SIGKILL);
      kill(pid_, SIGKILL);
      int status = 0;
      pid_t w;
      do {
        w = waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      if (w == pid_) exit_code_ = decode_status(status);
    }
  } else {
    // The leader is gone; sweep any descendants left in its group.
    kill(-pid_, SIGKILL);
  }
  close_fds();
  pid_ = -1;
  return exit_code_.value_or(-1);
}

}  // namespace revenant

#endif
