#pragma once

// revenant/transport.hpp — One framed exchange with the prover.
//
// send() writes one request unit and reads exactly one response unit within a
// deadline. It never retries. Any infrastructure failure taints the
// transport; a tainted transport refuses further sends and its ProcessHandle
// must be discarded.

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "revenant/process.hpp"
#include "revenant/protocol.hpp"
#include "revenant/types.hpp"

namespace revenant {

struct TransportResult {
  bool ok{false};
  std::string unit;  // raw JSON of the response unit when ok
  ErrorCode error{ErrorCode::none};
  std::string detail;
  std::optional<int> exit_code;
  std::string stderr_tail;
  uint64_t bytes_out{0};
  uint64_t bytes_in{0};
};

class Transport {
 public:
  static constexpr std::size_t kStderrTailBytes = 4096;

  // `process` must outlive the transport.
  explicit Transport(ProcessHandle& process);

  TransportResult send(std::string_view request_json, std::chrono::milliseconds timeout);

  bool tainted() const { return tainted_; }
  const std::string& stderr_tail() const { return stderr_tail_; }

  // Pull whatever the child wrote to stderr without blocking.
  void drain_stderr();

 private:
  TransportResult fail(ErrorCode code, std::string detail);
  void append_stderr(const char* data, std::size_t n);

  ProcessHandle& process_;
  FrameAssembler frames_;
  std::string stderr_tail_;
  bool tainted_{false};
};

}  // namespace revenant
