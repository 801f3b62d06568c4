#pragma once

// revenant/types.hpp — Core value types for the prover supervision engine.
//
// ID SPACES:
//   - Environment / ProofState ids minted by the prover are non-negative and
//     valid only against the process generation that minted them.
//   - Pinned states carry a negative logical session id (-1, -2, ...). These
//     survive restarts; the Supervisor maps them to the current underlying id.
//
// MEMORY OWNERSHIP:
//   - Request / Response / RunResult are value types. No borrowed references.
//   - Opaque prover payloads (tactics, infotree, declarations) are kept as
//     canonical JSON text and never interpreted.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace revenant {

enum class ErrorCode {
  none,
  protocol_error,
  timeout,
  process_terminated,
  memory_limit_exceeded,
  cache_replay_failed,
  restart_attempts_exhausted,
  spawn_failed,
  invalid_request,
  unknown_session,
  unknown_parent,
  transport_tainted,
  cross_process_use,
  cache_io_failed,
  config_invalid,
};

std::string to_string(ErrorCode code);

enum class FailureStage {
  none,
  validate,
  dispatch,
  restart,
  replay,
  cache,
};

std::string to_string(FailureStage stage);

// ---------------------------------------------------------------------------
// Option bag
// ---------------------------------------------------------------------------
// Keys are dotted names ("pp.all", "maxHeartbeats"). Values are a closed set
// of scalar kinds; the engine never interprets them.
struct OptionKey {
  std::vector<std::string> segments;

  static OptionKey parse(const std::string& dotted);
  std::string to_string() const;
  bool valid() const;

  bool operator<(const OptionKey& other) const { return segments < other.segments; }
  bool operator==(const OptionKey& other) const { return segments == other.segments; }
};

struct OptionName {
  std::string dotted;
  bool operator==(const OptionName& other) const { return dotted == other.dotted; }
};

using OptionValue = std::variant<bool, int64_t, std::string, OptionName>;
using OptionMap = std::map<OptionKey, OptionValue>;

// Caller entries win over defaults.
OptionMap overlay_options(const OptionMap& defaults, const OptionMap& overrides);

// Returns the dotted name of every invalid key (empty when all are valid).
std::vector<std::string> invalid_option_keys(const OptionMap& options);

// ---------------------------------------------------------------------------
// Request
// ---------------------------------------------------------------------------
enum class RequestKind {
  command,
  file_command,
  proof_step,
  pickle_environment,
  pickle_proof_state,
  unpickle_environment,
  unpickle_proof_state,
};

std::string to_string(RequestKind kind);

enum class InfoTreeMode {
  none,
  full,
  tactics,
  original,
  substantive,
};

std::string to_string(InfoTreeMode mode);

struct Request {
  RequestKind kind{RequestKind::command};
  // cmd / path / tactic / pickle path, depending on kind.
  std::string text;
  std::optional<int64_t> env;
  std::optional<int64_t> proof_state;

  bool all_tactics{false};
  bool root_goals{false};
  bool declarations{false};
  InfoTreeMode infotree{InfoTreeMode::none};

  OptionMap options;

  static Request command(std::string cmd, std::optional<int64_t> env = std::nullopt);
  static Request file_command(std::string path, std::optional<int64_t> env = std::nullopt);
  static Request proof_step(std::string tactic, int64_t proof_state);
  static Request pickle_environment(std::string pickle_to, int64_t env);
  static Request pickle_proof_state(std::string pickle_to, int64_t proof_state);
  static Request unpickle_environment(std::string pickle_from);
  static Request unpickle_proof_state(std::string pickle_from,
                                      std::optional<int64_t> env = std::nullopt);
};

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
struct Position {
  uint64_t line{0};
  uint64_t column{0};
};

struct Message {
  std::string severity;  // "error" | "warning" | "info" | "trace"
  Position pos;
  std::optional<Position> end_pos;
  std::string data;
};

struct Sorry {
  Position pos;
  std::optional<Position> end_pos;
  std::string goal;
  std::optional<int64_t> proof_state;
};

enum class ResponseKind {
  command,
  proof_step,
  lean_error,
};

std::string to_string(ResponseKind kind);

struct Response {
  ResponseKind kind{ResponseKind::command};
  std::optional<int64_t> env;
  std::optional<int64_t> proof_state;
  std::vector<Message> messages;
  std::vector<Sorry> sorries;
  std::vector<std::string> goals;
  std::string proof_status;
  std::string error_message;  // lean_error only

  // Flag-gated fields, populated only when the request asked for them.
  std::optional<std::string> tactics_json;
  std::optional<std::string> infotree_json;
  std::optional<std::string> declarations_json;
  std::optional<std::vector<std::string>> root_goals;
  // Proof states referenced by the tactics payload.
  std::vector<int64_t> tactic_proof_states;

  bool has_errors() const;
  std::vector<int64_t> minted_environments() const;
  std::vector<int64_t> minted_proof_states() const;
};

// ---------------------------------------------------------------------------
// RunResult — what Supervisor::run() hands back.
// ---------------------------------------------------------------------------
// ok && response.kind == lean_error : the prover rejected the input.
// !ok                               : the infrastructure failed.
struct Warning {
  ErrorCode code{ErrorCode::none};
  std::optional<int64_t> session_id;
  std::string detail;
};

struct RunResult {
  bool ok{false};
  Response response;
  ErrorCode error{ErrorCode::none};
  ErrorCode cause{ErrorCode::none};
  FailureStage stage{FailureStage::none};
  std::string detail;
  std::vector<Warning> warnings;
  uint32_t attempts{0};
  uint64_t generation{0};
  std::string request_digest;
};

}  // namespace revenant
