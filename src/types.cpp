#include "revenant/types.hpp"

#include <cctype>

namespace revenant {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::protocol_error: return "protocol_error";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::process_terminated: return "process_terminated";
    case ErrorCode::memory_limit_exceeded: return "memory_limit_exceeded";
    case ErrorCode::cache_replay_failed: return "cache_replay_failed";
    case ErrorCode::restart_attempts_exhausted: return "restart_attempts_exhausted";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::invalid_request: return "invalid_request";
    case ErrorCode::unknown_session: return "unknown_session";
    case ErrorCode::unknown_parent: return "unknown_parent";
    case ErrorCode::transport_tainted: return "transport_tainted";
    case ErrorCode::cross_process_use: return "cross_process_use";
    case ErrorCode::cache_io_failed: return "cache_io_failed";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(FailureStage stage) {
  switch (stage) {
    case FailureStage::none: return "";
    case FailureStage::validate: return "validate";
    case FailureStage::dispatch: return "dispatch";
    case FailureStage::restart: return "restart";
    case FailureStage::replay: return "replay";
    case FailureStage::cache: return "cache";
  }
  return "";
}

std::string to_string(RequestKind kind) {
  switch (kind) {
    case RequestKind::command: return "command";
    case RequestKind::file_command: return "file_command";
    case RequestKind::proof_step: return "proof_step";
    case RequestKind::pickle_environment: return "pickle_environment";
    case RequestKind::pickle_proof_state: return "pickle_proof_state";
    case RequestKind::unpickle_environment: return "unpickle_environment";
    case RequestKind::unpickle_proof_state: return "unpickle_proof_state";
  }
  return "";
}

std::string to_string(InfoTreeMode mode) {
  switch (mode) {
    case InfoTreeMode::none: return "";
    case InfoTreeMode::full: return "full";
    case InfoTreeMode::tactics: return "tactics";
    case InfoTreeMode::original: return "original";
    case InfoTreeMode::substantive: return "substantive";
  }
  return "";
}

std::string to_string(ResponseKind kind) {
  switch (kind) {
    case ResponseKind::command: return "command";
    case ResponseKind::proof_step: return "proof_step";
    case ResponseKind::lean_error: return "lean_error";
  }
  return "";
}

// ---------------------------------------------------------------------------
// OptionKey
// ---------------------------------------------------------------------------

OptionKey OptionKey::parse(const std::string& dotted) {
  OptionKey key;
  std::string cur;
  for (char c : dotted) {
    if (c == '.') {
      key.segments.push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }
  key.segments.push_back(cur);
  return key;
}

std::string OptionKey::to_string() const {
  std::string out;
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i) out += '.';
    out += segments[i];
  }
  return out;
}

bool OptionKey::valid() const {
  if (segments.empty()) return false;
  for (const auto& seg : segments) {
    if (seg.empty()) return false;
    const unsigned char first = static_cast<unsigned char>(seg[0]);
    if (!(std::isalpha(first) || first == '_')) return false;
    for (unsigned char c : seg) {
      if (!(std::isalnum(c) || c == '_' || c == '\'')) return false;
    }
  }
  return true;
}

OptionMap overlay_options(const OptionMap& defaults, const OptionMap& overrides) {
  OptionMap out = defaults;
  for (const auto& [k, v] : overrides) out[k] = v;
  return out;
}

std::vector<std::string> invalid_option_keys(const OptionMap& options) {
  std::vector<std::string> bad;
  for (const auto& [k, v] : options) {
    (void)v;
    if (!k.valid()) bad.push_back(k.to_string());
  }
  return bad;
}

// ---------------------------------------------------------------------------
// Request factories
// ---------------------------------------------------------------------------

Request Request::command(std::string cmd, std::optional<int64_t> env) {
  Request r;
  r.kind = RequestKind::command;
  r.text = std::move(cmd);
  r.env = env;
  return r;
}

Request Request::file_command(std::string path, std::optional<int64_t> env) {
  Request r;
  r.kind = RequestKind::file_command;
  r.text = std::move(path);
  r.env = env;
  return r;
}

Request Request::proof_step(std::string tactic, int64_t proof_state) {
  Request r;
  r.kind = RequestKind::proof_step;
  r.text = std::move(tactic);
  r.proof_state = proof_state;
  return r;
}

Request Request::pickle_environment(std::string pickle_to, int64_t env) {
  Request r;
  r.kind = RequestKind::pickle_environment;
  r.text = std::move(pickle_to);
  r.env = env;
  return r;
}

Request Request::pickle_proof_state(std::string pickle_to, int64_t proof_state) {
  Request r;
  r.kind = RequestKind::pickle_proof_state;
  r.text = std::move(pickle_to);
  r.proof_state = proof_state;
  return r;
}

Request Request::unpickle_environment(std::string pickle_from) {
  Request r;
  r.kind = RequestKind::unpickle_environment;
  r.text = std::move(pickle_from);
  return r;
}

Request Request::unpickle_proof_state(std::string pickle_from, std::optional<int64_t> env) {
  Request r;
  r.kind = RequestKind::unpickle_proof_state;
  r.text = std::move(pickle_from);
  r.env = env;
  return r;
}

// ---------------------------------------------------------------------------
// Response helpers
// ---------------------------------------------------------------------------

bool Response::has_errors() const {
  if (kind == ResponseKind::lean_error) return true;
  for (const auto& m : messages) {
    if (m.severity == "error") return true;
  }
  return false;
}

std::vector<int64_t> Response::minted_environments() const {
  std::vector<int64_t> out;
  if (kind == ResponseKind::command && env) out.push_back(*env);
  return out;
}

std::vector<int64_t> Response::minted_proof_states() const {
  std::vector<int64_t> out;
  if (kind == ResponseKind::lean_error) return out;
  if (proof_state) out.push_back(*proof_state);
  for (const auto& s : sorries) {
    if (s.proof_state) out.push_back(*s.proof_state);
  }
  out.insert(out.end(), tactic_proof_states.begin(), tactic_proof_states.end());
  return out;
}

}  // namespace revenant
