#pragma once

// revenant/supervisor.hpp — Restart / replay state machine around one prover.
//
// STATES:
//   idle -> active -> idle                       successful dispatch
//   active -> crashed                            terminated / timeout / protocol error
//   active -> degraded                           resource breach after a response
//   crashed | degraded | stopped -> restarting   before the next dispatch
//   restarting -> idle                           new process live, pins replayed
//   any -> stopped                               kill() or memory_limit_exceeded
//
// INVARIANTS:
//   1. One process per Supervisor; concurrent run() calls are linearized by
//      the RequestSerializer in arrival order.
//   2. Non-negative ids are valid only for the process generation that
//      minted them. A restart invalidates every unpinned id.
//   3. Pinned states are replayed into every new process in creation order
//      and keep their negative logical session id across restarts.
//   4. Caller-input errors are reported before any dispatch and never retried.
//   5. The ceiling bounds attempts per run(): a dispatch, or a restart that
//      failed before its dispatch, each count as one.
//   6. A pinned state that fails to replay is discarded with a warning, even
//      when it takes the process down; the restart then respawns and replays
//      the remaining states.
//   7. A replay-strategy pin must name only pinned parents. A pin whose parent
//      is a raw id is refused with a warning and the response keeps raw ids.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "revenant/config.hpp"
#include "revenant/observability.hpp"
#include "revenant/process.hpp"
#include "revenant/resource_monitor.hpp"
#include "revenant/serializer.hpp"
#include "revenant/session_cache.hpp"
#include "revenant/transport.hpp"
#include "revenant/types.hpp"

namespace revenant {

enum class SupervisorState {
  idle,
  active,
  degraded,
  crashed,
  restarting,
  stopped,
};

std::string to_string(SupervisorState state);

struct RunOptions {
  // Durably cache the produced Environment / ProofState and replay it after
  // every restart. The response then reports the logical session id.
  bool pin{false};
  // Overrides SupervisorConfig::request_timeout for this request.
  std::optional<std::chrono::milliseconds> timeout;
};

class Supervisor {
 public:
  // `cache` may be shared between Supervisors. When null, a SessionCache is
  // opened on config.cache_dir (or a private temporary directory).
  explicit Supervisor(SupervisorConfig config,
                      std::shared_ptr<ISessionCache> cache = nullptr,
                      ResourceMonitor::Probe probe = {});
  ~Supervisor();

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Spawn the process (if needed) and replay pinned states.
  RunResult start();

  RunResult run(const Request& request, const RunOptions& options = {});

  // Force a restart and replay now.
  RunResult restart();

  // Terminate the process. The next run() starts a fresh one.
  void kill();

  // Waits for any in-flight request.
  bool is_alive();

  SupervisorState state() const { return state_.load(std::memory_order_acquire); }
  uint64_t generation() const { return generation_.load(std::memory_order_acquire); }
  const SupervisorStats& stats() const { return stats_; }
  const SupervisorConfig& config() const { return config_; }
  const ConfigValidationResult& config_validation() const { return validation_; }
  ISessionCache& session_cache() { return *cache_; }

  std::vector<SessionState> pinned_states() const;
  bool unpin(int64_t session_id);
  std::size_t clear_session_cache();

 private:
  struct Failure {
    ErrorCode code{ErrorCode::none};
    FailureStage stage{FailureStage::none};
    std::string detail;
    ErrorCode cause{ErrorCode::none};
  };

  struct Binding {
    SessionKind kind{SessionKind::environment};
    int64_t id{0};
  };

  bool needs_restart() const;
  void set_state(SupervisorState s) { state_.store(s, std::memory_order_release); }

  std::optional<Failure> validate(const Request& request) const;
  std::optional<Failure> ensure_ready(std::vector<Warning>& warnings, uint32_t& attempts,
                                      const std::string& digest);
  std::optional<Failure> restart_process(std::vector<Warning>& warnings);
  std::optional<Failure> spawn_process();
  std::optional<Failure> replay_pinned(std::vector<Warning>& warnings);
  // Every failure discards the state with a warning. A failure that also
  // lost the process is returned so the caller can respawn.
  std::optional<Failure> replay_state(const SessionState& state, std::vector<Warning>& warnings, int depth);
  void reject_replay(const SessionState& state, const std::string& detail, std::vector<Warning>& warnings);
  void terminate_process();

  // Map logical (negative) parent ids to the ids bound in this generation.
  std::optional<Request> translate(const Request& request, int64_t* missing) const;
  // Inverse for pinning: raw ids bound to a pinned state become logical ids.
  Request to_logical(const Request& request) const;

  struct Exchange {
    bool ok{false};
    Response response;
    ErrorCode error{ErrorCode::none};
    std::string detail;
  };
  Exchange exchange(const Request& wire_request, std::chrono::milliseconds timeout);

  void record_minted(const Response& response);
  void pin_response(const Request& request, Response& response, std::vector<Warning>& warnings,
                    const std::string& digest);
  void check_resources(const std::string& digest);

  void log(const std::string& message) const;
  void emit(EventKind kind, bool ok, ErrorCode error, const std::string& digest, uint32_t attempt,
            std::optional<int64_t> session_id, uint64_t duration_ns, const std::string& detail) const;

  RunResult fail(RunResult result, const Failure& f) const;

  SupervisorConfig config_;
  ConfigValidationResult validation_;
  std::shared_ptr<ISessionCache> cache_;
  std::string owned_cache_dir_;
  ResourceMonitor monitor_;
  RequestSerializer gate_;
  SupervisorStats stats_;

  // Everything below is only touched while the gate is held.
  std::unique_ptr<ProcessHandle> process_;
  std::unique_ptr<Transport> transport_;
  std::set<int64_t> minted_envs_;
  std::set<int64_t> minted_proof_states_;
  std::map<int64_t, Binding> bindings_;  // session id -> id in this generation
  std::set<std::string> discarded_keys_;  // rejected during the current restart

  std::atomic<SupervisorState> state_{SupervisorState::idle};
  std::atomic<uint64_t> generation_{0};
};

}  // namespace revenant
