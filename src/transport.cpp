#include "revenant/transport.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <array>
#include <cstring>

#include "revenant/jsonlite.hpp"

namespace revenant {

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  if (left <= 0) return 0;
  return left > 1000 ? 1000 : static_cast<int>(left);
}

// Grace for collecting an exit status after EOF / EPIPE.
constexpr std::chrono::milliseconds kExitReapWait{500};

}  // namespace

Transport::Transport(ProcessHandle& process) : process_(process) {}

void Transport::append_stderr(const char* data, std::size_t n) {
  stderr_tail_.append(data, n);
  if (stderr_tail_.size() > kStderrTailBytes) {
    stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
  }
}

void Transport::drain_stderr() {
  const int fd = process_.stderr_fd();
  if (fd < 0) return;
  std::array<char, 4096> buf{};
  while (true) {
    const ssize_t n = read(fd, buf.data(), buf.size());
    if (n > 0) {
      append_stderr(buf.data(), static_cast<std::size_t>(n));
      continue;
    }
    break;
  }
}

TransportResult Transport::fail(ErrorCode code, std::string detail) {
  tainted_ = true;
  drain_stderr();
  TransportResult r;
  r.error = code;
  r.detail = std::move(detail);
  r.stderr_tail = stderr_tail_;
  if (code == ErrorCode::process_terminated) {
    r.exit_code = process_.wait_exit(kExitReapWait);
  } else {
    r.exit_code = process_.exit_code();
  }
  return r;
}

TransportResult Transport::send(std::string_view request_json, std::chrono::milliseconds timeout) {
  if (tainted_) {
    TransportResult r;
    r.error = ErrorCode::transport_tainted;
    r.detail = "transport discarded after an earlier failure";
    r.stderr_tail = stderr_tail_;
    return r;
  }
  if (!process_.is_alive()) {
    return fail(ErrorCode::process_terminated, "process exited before send");
  }

  const auto deadline = Clock::now() + timeout;
  std::array<char, 65536> buf{};

  // Anything already waiting on stdout was not asked for.
  while (true) {
    const ssize_t n = read(process_.stdout_fd(), buf.data(), buf.size());
    if (n > 0) {
      frames_.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)));
      continue;
    }
    if (n == 0) return fail(ErrorCode::process_terminated, "stdout closed before send");
    break;
  }
  if (frames_.has_partial()) {
    return fail(ErrorCode::protocol_error, "unsolicited output on stdout");
  }
  frames_.clear();

  std::string payload(request_json);
  payload.append(kFrameTerminator);

  TransportResult result;
  std::size_t written = 0;
  while (written < payload.size()) {
    pollfd fds[2] = {{process_.stdin_fd(), POLLOUT, 0}, {process_.stderr_fd(), POLLIN, 0}};
    const int wait = remaining_ms(deadline);
    if (wait == 0 && Clock::now() >= deadline) {
      return fail(ErrorCode::timeout, "timed out writing request");
    }
    const int pr = poll(fds, 2, wait);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return fail(ErrorCode::protocol_error, std::string("poll: ") + std::strerror(errno));
    }
    if (fds[1].revents & POLLIN) drain_stderr();
    if (fds[0].revents & (POLLERR | POLLHUP)) {
      return fail(ErrorCode::process_terminated, "stdin closed by process");
    }
    if (!(fds[0].revents & POLLOUT)) continue;
    const ssize_t n = write(process_.stdin_fd(), payload.data() + written, payload.size() - written);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      if (errno == EPIPE) return fail(ErrorCode::process_terminated, "broken pipe writing request");
      return fail(ErrorCode::protocol_error, std::string("write: ") + std::strerror(errno));
    }
    written += static_cast<std::size_t>(n);
  }
  result.bytes_out = written;

  bool stderr_open = true;
  while (true) {
    if (auto unit = frames_.next()) {
      if (frames_.has_partial()) {
        return fail(ErrorCode::protocol_error, "trailing output after response unit");
      }
      std::optional<jsonlite::JsonError> err;
      (void)jsonlite::parse(*unit, &err);
      if (err) {
        return fail(ErrorCode::protocol_error, "malformed response: " + err->message);
      }
      drain_stderr();
      result.ok = true;
      result.unit = std::move(*unit);
      result.stderr_tail = stderr_tail_;
      return result;
    }
    if (frames_.overflowed()) {
      return fail(ErrorCode::protocol_error, "response unit exceeds size bound");
    }

    const int wait = remaining_ms(deadline);
    if (wait == 0 && Clock::now() >= deadline) {
      return fail(ErrorCode::timeout, "no response within " + std::to_string(timeout.count()) + " ms");
    }
    pollfd fds[2] = {{process_.stdout_fd(), POLLIN, 0}, {stderr_open ? process_.stderr_fd() : -1, POLLIN, 0}};
    const int pr = poll(fds, 2, wait);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return fail(ErrorCode::protocol_error, std::string("poll: ") + std::strerror(errno));
    }
    if (pr == 0) continue;

    if (fds[1].revents & (POLLIN | POLLHUP)) {
      const ssize_t n = read(process_.stderr_fd(), buf.data(), buf.size());
      if (n > 0) append_stderr(buf.data(), static_cast<std::size_t>(n));
      else if (n == 0) stderr_open = false;
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      const ssize_t n = read(process_.stdout_fd(), buf.data(), buf.size());
      if (n > 0) {
        result.bytes_in += static_cast<uint64_t>(n);
        frames_.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)));
      } else if (n == 0) {
        return fail(ErrorCode::process_terminated, "stdout closed mid-request");
      } else if (errno != EAGAIN && errno != EINTR) {
        return fail(ErrorCode::process_terminated, std::string("read: ") + std::strerror(errno));
      }
    }
  }
}

}  // namespace revenant
