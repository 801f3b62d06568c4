#pragma once

// revenant/observability.hpp — Counters, structured events and diagnostics.
//
// DESIGN:
//   SupervisorStats is owned by each Supervisor (no global registry).
//   SupervisorEvent is the observable unit for dispatch / restart / replay /
//   breach / give_up. Events go to the process-wide hook when one is set,
//   otherwise to the JSONL file named by REVENANT_EVENT_LOG.
//   Diagnostic lines go to std::cerr with a "[revenant]" prefix when the
//   Supervisor is configured verbose.
//
// Event emission never throws and never blocks on anything but the append.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "revenant/types.hpp"

namespace revenant {

struct SupervisorStats {
  alignas(64) std::atomic<uint64_t> requests{0};
  std::atomic<uint64_t> requests_ok{0};
  std::atomic<uint64_t> requests_failed{0};
  std::atomic<uint64_t> dispatch_attempts{0};

  alignas(64) std::atomic<uint64_t> restarts{0};
  std::atomic<uint64_t> crashes{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> spawn_failures{0};
  std::atomic<uint64_t> memory_breaches{0};

  alignas(64) std::atomic<uint64_t> replays_ok{0};
  std::atomic<uint64_t> replays_failed{0};
  std::atomic<uint64_t> cache_puts{0};
  std::atomic<uint64_t> cache_put_failures{0};
  std::atomic<uint64_t> serializer_contention{0};

  std::atomic<uint64_t> bytes_out{0};
  std::atomic<uint64_t> bytes_in{0};

  void record_failure(ErrorCode code);
  std::string to_json() const;
};

enum class EventKind {
  spawn,
  dispatch,
  restart,
  replay,
  breach,
  give_up,
};

std::string to_string(EventKind kind);

struct SupervisorEvent {
  EventKind kind{EventKind::dispatch};
  uint64_t generation{0};
  uint32_t attempt{0};
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string request_digest;
  std::optional<int64_t> session_id;
  uint64_t duration_ns{0};
  std::string detail;

  std::string to_json() const;
};

using SupervisorEventHook = void (*)(const SupervisorEvent&);
void set_supervisor_event_hook(SupervisorEventHook hook);

// Hook if set, else JSONL append to $REVENANT_EVENT_LOG if set, else nothing.
void emit_supervisor_event(const SupervisorEvent& ev);

// "[revenant] <message>" on std::cerr.
void log_line(const std::string& message);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace revenant
