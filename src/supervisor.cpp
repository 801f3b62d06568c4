#include "revenant/supervisor.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <iterator>
#include <random>
#include <set>

#include "revenant/hash.hpp"
#include "revenant/protocol.hpp"

namespace fs = std::filesystem;

namespace revenant {

namespace {

constexpr int kMaxReplayDepth = 64;

std::string make_private_cache_dir() {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec) base = "/tmp";
  std::random_device rd;
  std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) ^ rd());
  char suffix[17];
  std::snprintf(suffix, sizeof(suffix), "%016llx", static_cast<unsigned long long>(rng()));
  const fs::path dir = base / ("revenant-" + std::to_string(::getpid()) + "-" + suffix);
  fs::create_directories(dir, ec);
  return dir.string();
}

std::string join(const std::vector<std::string>& parts) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out += "; ";
    out += p;
  }
  return out;
}

std::string describe_transport_failure(const TransportResult& tr) {
  std::string detail = tr.detail;
  if (tr.exit_code) detail += " (exit " + std::to_string(*tr.exit_code) + ")";
  if (!tr.stderr_tail.empty()) detail += "; stderr: " + tr.stderr_tail;
  return detail;
}

}  // namespace

std::string to_string(SupervisorState state) {
  switch (state) {
    case SupervisorState::idle: return "idle";
    case SupervisorState::active: return "active";
    case SupervisorState::degraded: return "degraded";
    case SupervisorState::crashed: return "crashed";
    case SupervisorState::restarting: return "restarting";
    case SupervisorState::stopped: return "stopped";
  }
  return "";
}

Supervisor::Supervisor(SupervisorConfig config, std::shared_ptr<ISessionCache> cache, ResourceMonitor::Probe probe)
    : config_(std::move(config)),
      validation_(validate_config(config_)),
      monitor_(ResourceLimits{config_.max_process_memory, config_.max_system_memory,
                              config_.memory_hard_limit_mb * 1024ull * 1024ull, config_.max_uptime},
               std::move(probe)) {
  if (cache) {
    cache_ = std::move(cache);
  } else {
    std::string dir = config_.cache_dir;
    if (dir.empty()) {
      owned_cache_dir_ = make_private_cache_dir();
      dir = owned_cache_dir_;
    }
    cache_ = std::make_shared<SessionCache>(dir, config_.cache_retention, config_.cache_compression);
  }
  for (const auto& w : validation_.warnings) log("config: " + w);
}

Supervisor::~Supervisor() {
  terminate_process();
  if (!owned_cache_dir_.empty()) {
    std::error_code ec;
    fs::remove_all(owned_cache_dir_, ec);
  }
}

// ---------------------------------------------------------------------------
// Public surface
// ---------------------------------------------------------------------------

RunResult Supervisor::start() {
  RunResult result;
  auto guard = gate_.acquire();
  if (!guard.held()) {
    return fail(std::move(result), {ErrorCode::cross_process_use, FailureStage::validate,
                                    "supervisor used from a forked child"});
  }
  if (!validation_.ok) {
    return fail(std::move(result), {ErrorCode::config_invalid, FailureStage::validate, join(validation_.errors)});
  }
  uint32_t attempts = 0;
  if (auto f = ensure_ready(result.warnings, attempts, "")) {
    result.attempts = attempts;
    return fail(std::move(result), *f);
  }
  result.ok = true;
  result.attempts = attempts;
  result.generation = generation();
  return result;
}

RunResult Supervisor::restart() {
  RunResult result;
  auto guard = gate_.acquire();
  if (!guard.held()) {
    return fail(std::move(result), {ErrorCode::cross_process_use, FailureStage::validate,
                                    "supervisor used from a forked child"});
  }
  if (!validation_.ok) {
    return fail(std::move(result), {ErrorCode::config_invalid, FailureStage::validate, join(validation_.errors)});
  }
  set_state(SupervisorState::restarting);
  uint32_t attempts = 0;
  if (auto f = ensure_ready(result.warnings, attempts, "")) {
    result.attempts = attempts;
    return fail(std::move(result), *f);
  }
  result.ok = true;
  result.attempts = attempts;
  result.generation = generation();
  return result;
}

void Supervisor::kill() {
  auto guard = gate_.acquire();
  if (!guard.held()) return;
  terminate_process();
  set_state(SupervisorState::stopped);
  log("killed at generation " + std::to_string(generation()));
}

bool Supervisor::is_alive() {
  auto guard = gate_.acquire();
  if (!guard.held()) return false;
  if (state() == SupervisorState::stopped || !process_) return false;
  return process_->is_alive();
}

std::vector<SessionState> Supervisor::pinned_states() const { return cache_->list(); }

bool Supervisor::unpin(int64_t session_id) {
  auto guard = gate_.acquire();
  if (!guard.held()) return false;
  auto st = cache_->find_session(session_id);
  if (!st) return false;
  bindings_.erase(session_id);
  return cache_->clear(st->key);
}

std::size_t Supervisor::clear_session_cache() {
  auto guard = gate_.acquire();
  if (!guard.held()) return 0;
  bindings_.clear();
  return cache_->clear_all();
}

RunResult Supervisor::run(const Request& request, const RunOptions& options) {
  stats_.requests.fetch_add(1, std::memory_order_relaxed);

  Request merged = request;
  merged.options = overlay_options(config_.effective_default_options(), request.options);

  RunResult result;
  result.request_digest = request_digest(encode_request(merged));
  const std::string& digest = result.request_digest;

  auto guard = gate_.acquire();
  stats_.serializer_contention.store(gate_.contended(), std::memory_order_relaxed);
  if (!guard.held()) {
    stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
    return fail(std::move(result), {ErrorCode::cross_process_use, FailureStage::validate,
                                    "supervisor used from a forked child"});
  }

  if (auto f = validate(merged)) {
    stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
    return fail(std::move(result), *f);
  }

  const auto timeout = options.timeout.value_or(config_.request_timeout);
  uint32_t attempts = 0;
  for (;;) {
    if (auto f = ensure_ready(result.warnings, attempts, digest)) {
      stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
      result.attempts = attempts;
      return fail(std::move(result), *f);
    }

    int64_t missing = 0;
    auto wire = translate(merged, &missing);
    if (!wire) {
      // Pinned by another Supervisor sharing the cache, not yet replayed here.
      if (auto st = cache_->find_session(missing)) {
        if (auto f = replay_state(*st, result.warnings, 0)) {
          ++attempts;
          if (attempts >= config_.max_attempts) {
            stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
            result.attempts = attempts;
            emit(EventKind::give_up, false, ErrorCode::restart_attempts_exhausted, digest, attempts, missing, 0,
                 f->detail);
            return fail(std::move(result), {ErrorCode::restart_attempts_exhausted, FailureStage::replay, f->detail,
                                            f->code});
          }
          continue;
        }
        if (bindings_.count(missing)) continue;
      }
      stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
      result.attempts = attempts;
      return fail(std::move(result), {ErrorCode::unknown_session, FailureStage::replay,
                                      "session " + std::to_string(missing) + " could not be restored"});
    }

    ++attempts;
    stats_.dispatch_attempts.fetch_add(1, std::memory_order_relaxed);
    set_state(SupervisorState::active);

    uint64_t ns = 0;
    Exchange ex;
    {
      ScopeTimer t(ns);
      ex = exchange(*wire, timeout);
    }
    emit(EventKind::dispatch, ex.ok, ex.error, digest, attempts, std::nullopt, ns, ex.detail);

    if (ex.ok) {
      set_state(SupervisorState::idle);
      record_minted(ex.response);
      result.response = std::move(ex.response);
      if (options.pin) pin_response(merged, result.response, result.warnings, digest);
      check_resources(digest);
      result.ok = true;
      result.attempts = attempts;
      result.generation = generation();
      stats_.requests_ok.fetch_add(1, std::memory_order_relaxed);
      return result;
    }

    log("attempt " + std::to_string(attempts) + " failed: " + to_string(ex.error) + ": " + ex.detail);

    if (ex.error == ErrorCode::timeout && !config_.retry_on_timeout) {
      stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
      result.attempts = attempts;
      return fail(std::move(result), {ErrorCode::timeout, FailureStage::dispatch, ex.detail});
    }
    if (attempts >= config_.max_attempts) {
      emit(EventKind::give_up, false, ErrorCode::restart_attempts_exhausted, digest, attempts, std::nullopt, 0,
           ex.detail);
      stats_.requests_failed.fetch_add(1, std::memory_order_relaxed);
      result.attempts = attempts;
      return fail(std::move(result), {ErrorCode::restart_attempts_exhausted, FailureStage::dispatch, ex.detail,
                                      ex.error});
    }
  }
}

// ---------------------------------------------------------------------------
// Validation and id translation
// ---------------------------------------------------------------------------

bool Supervisor::needs_restart() const {
  if (!process_ || !transport_ || transport_->tainted()) return true;
  switch (state()) {
    case SupervisorState::degraded:
    case SupervisorState::crashed:
    case SupervisorState::restarting:
    case SupervisorState::stopped:
      return true;
    default:
      return false;
  }
}

std::optional<Supervisor::Failure> Supervisor::validate(const Request& request) const {
  if (!validation_.ok) {
    return Failure{ErrorCode::config_invalid, FailureStage::validate, join(validation_.errors)};
  }
  if (request.text.empty()) {
    return Failure{ErrorCode::invalid_request, FailureStage::validate,
                   to_string(request.kind) + " requires non-empty text"};
  }
  const auto bad = invalid_option_keys(request.options);
  if (!bad.empty()) {
    return Failure{ErrorCode::invalid_request, FailureStage::validate, "invalid option key: " + join(bad)};
  }
  if ((request.kind == RequestKind::proof_step || request.kind == RequestKind::pickle_proof_state) &&
      !request.proof_state) {
    return Failure{ErrorCode::invalid_request, FailureStage::validate,
                   to_string(request.kind) + " requires a proof state"};
  }
  if (request.kind == RequestKind::pickle_environment && !request.env) {
    return Failure{ErrorCode::invalid_request, FailureStage::validate, "pickle_environment requires an environment"};
  }

  auto check = [&](std::optional<int64_t> id, SessionKind kind) -> std::optional<Failure> {
    if (!id) return std::nullopt;
    if (*id < 0) {
      auto b = bindings_.find(*id);
      if (b != bindings_.end() && b->second.kind == kind) return std::nullopt;
      auto st = cache_->find_session(*id);
      if (st && st->kind == kind) return std::nullopt;
      return Failure{ErrorCode::unknown_session, FailureStage::validate,
                     "no pinned " + to_string(kind) + " with session id " + std::to_string(*id)};
    }
    if (!config_.strict_id_tracking) return std::nullopt;
    const auto& minted = kind == SessionKind::environment ? minted_envs_ : minted_proof_states_;
    if (needs_restart() || !minted.count(*id)) {
      return Failure{ErrorCode::unknown_parent, FailureStage::validate,
                     to_string(kind) + " " + std::to_string(*id) + " is not live in generation " +
                         std::to_string(generation())};
    }
    return std::nullopt;
  };
  if (auto f = check(request.env, SessionKind::environment)) return f;
  if (auto f = check(request.proof_state, SessionKind::proof_state)) return f;
  return std::nullopt;
}

std::optional<Request> Supervisor::translate(const Request& request, int64_t* missing) const {
  Request wire = request;
  auto map_id = [&](std::optional<int64_t>& id) {
    if (!id || *id >= 0) return true;
    auto it = bindings_.find(*id);
    if (it == bindings_.end()) {
      if (missing) *missing = *id;
      return false;
    }
    id = it->second.id;
    return true;
  };
  if (!map_id(wire.env)) return std::nullopt;
  if (!map_id(wire.proof_state)) return std::nullopt;
  return wire;
}

Request Supervisor::to_logical(const Request& request) const {
  Request logical = request;
  auto map_id = [&](std::optional<int64_t>& id, SessionKind kind) {
    if (!id || *id < 0) return;
    for (const auto& [sid, b] : bindings_) {
      if (b.kind == kind && b.id == *id) {
        id = sid;
        return;
      }
    }
  };
  map_id(logical.env, SessionKind::environment);
  map_id(logical.proof_state, SessionKind::proof_state);
  return logical;
}

// ---------------------------------------------------------------------------
// Process lifecycle
// ---------------------------------------------------------------------------

std::optional<Supervisor::Failure> Supervisor::ensure_ready(std::vector<Warning>& warnings, uint32_t& attempts,
                                                            const std::string& digest) {
  uint32_t breach_restarts = 0;
  while (needs_restart()) {
    if (auto f = restart_process(warnings)) {
      ++attempts;
      log("restart failed: " + to_string(f->code) + ": " + f->detail);
      if (attempts >= config_.max_attempts) {
        emit(EventKind::give_up, false, ErrorCode::restart_attempts_exhausted, digest, attempts, std::nullopt, 0,
             f->detail);
        return Failure{ErrorCode::restart_attempts_exhausted, f->stage, f->detail, f->code};
      }
      continue;
    }
    const auto sample = monitor_.sample(process_->pid(), process_->started_at());
    auto breach = monitor_.check(sample);
    if (breach && breach->kind != BreachKind::uptime) {
      stats_.memory_breaches.fetch_add(1, std::memory_order_relaxed);
      emit(EventKind::breach, false, ErrorCode::memory_limit_exceeded, digest, attempts, std::nullopt, 0,
           breach->describe());
      log("breach after restart: " + breach->describe());
      if (++breach_restarts >= config_.max_attempts) {
        terminate_process();
        set_state(SupervisorState::stopped);
        return Failure{ErrorCode::memory_limit_exceeded, FailureStage::restart, breach->describe()};
      }
      set_state(SupervisorState::degraded);
    }
  }
  return std::nullopt;
}

std::optional<Supervisor::Failure> Supervisor::restart_process(std::vector<Warning>& warnings) {
  const bool replacing = process_ != nullptr || generation() > 0;
  set_state(SupervisorState::restarting);
  terminate_process();
  if (replacing) stats_.restarts.fetch_add(1, std::memory_order_relaxed);
  discarded_keys_.clear();

  // Each pass that loses the process discards one more state, so this ends.
  for (;;) {
    if (auto f = spawn_process()) return f;
    uint64_t ns = 0;
    std::optional<Failure> lost;
    {
      ScopeTimer t(ns);
      lost = replay_pinned(warnings);
    }
    if (!lost) {
      set_state(SupervisorState::idle);
      emit(EventKind::restart, true, ErrorCode::none, "", 0, std::nullopt, ns,
           std::to_string(bindings_.size()) + " sessions restored");
      return std::nullopt;
    }
    emit(EventKind::restart, false, lost->code, "", 0, std::nullopt, ns, lost->detail);
    log("replay lost the process, respawning: " + lost->detail);
    set_state(SupervisorState::restarting);
    terminate_process();
    stats_.restarts.fetch_add(1, std::memory_order_relaxed);
  }
}

std::optional<Supervisor::Failure> Supervisor::spawn_process() {
  ProcessSpec spec;
  spec.command = config_.command;
  spec.argv = config_.argv;
  spec.env = config_.env;
  spec.cwd = config_.cwd;
  spec.memory_hard_limit_mb = config_.memory_hard_limit_mb;

  std::string err;
  uint64_t ns = 0;
  {
    ScopeTimer t(ns);
    process_ = ProcessHandle::spawn(spec, &err);
  }
  if (!process_) {
    stats_.record_failure(ErrorCode::spawn_failed);
    set_state(SupervisorState::crashed);
    emit(EventKind::spawn, false, ErrorCode::spawn_failed, "", 0, std::nullopt, ns, err);
    return Failure{ErrorCode::spawn_failed, FailureStage::restart, err};
  }
  const uint64_t gen = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
  transport_ = std::make_unique<Transport>(*process_);
  emit(EventKind::spawn, true, ErrorCode::none, "", 0, std::nullopt, ns, "pid " + std::to_string(process_->pid()));
  log("spawned generation " + std::to_string(gen) + " pid " + std::to_string(process_->pid()));
  return std::nullopt;
}

void Supervisor::terminate_process() {
  transport_.reset();
  if (process_) {
    process_->terminate(config_.terminate_grace);
    process_.reset();
  }
  minted_envs_.clear();
  minted_proof_states_.clear();
  bindings_.clear();
}

// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------

std::optional<Supervisor::Failure> Supervisor::replay_pinned(std::vector<Warning>& warnings) {
  for (const auto& st : cache_->list()) {
    if (bindings_.count(st.session_id) || discarded_keys_.count(st.key)) continue;
    if (auto f = replay_state(st, warnings, 0)) return f;
  }
  return std::nullopt;
}

void Supervisor::reject_replay(const SessionState& state, const std::string& detail, std::vector<Warning>& warnings) {
  stats_.replays_failed.fetch_add(1, std::memory_order_relaxed);
  discarded_keys_.insert(state.key);
  warnings.push_back(Warning{ErrorCode::cache_replay_failed, state.session_id, detail});
  if (!cache_->clear(state.key)) log("could not discard session " + std::to_string(state.session_id));
  emit(EventKind::replay, false, ErrorCode::cache_replay_failed, state.request_digest, 0, state.session_id, 0, detail);
  log("discarded session " + std::to_string(state.session_id) + ": " + detail);
}

std::optional<Supervisor::Failure> Supervisor::replay_state(const SessionState& state, std::vector<Warning>& warnings,
                                                            int depth) {
  std::string err;
  auto request = decode_request(state.recipe, &err);
  if (!request) {
    reject_replay(state, "corrupt recipe: " + err, warnings);
    return std::nullopt;
  }

  // Parents pinned later than this state are restored first.
  for (auto parent : {request->env, request->proof_state}) {
    if (!parent || *parent >= 0 || bindings_.count(*parent) || depth >= kMaxReplayDepth) continue;
    auto st = cache_->find_session(*parent);
    if (st && !discarded_keys_.count(st->key)) {
      if (auto f = replay_state(*st, warnings, depth + 1)) return f;
    }
  }

  int64_t missing = 0;
  auto wire = translate(*request, &missing);
  if (!wire) {
    reject_replay(state, "parent session " + std::to_string(missing) + " unavailable", warnings);
    return std::nullopt;
  }

  uint64_t ns = 0;
  Exchange ex;
  {
    ScopeTimer t(ns);
    ex = exchange(*wire, config_.replay_timeout);
  }
  if (!ex.ok) {
    reject_replay(state, to_string(ex.error) + ": " + ex.detail, warnings);
    return Failure{ex.error, FailureStage::replay,
                   "replaying session " + std::to_string(state.session_id) + ": " + ex.detail};
  }

  const Response& r = ex.response;
  std::optional<int64_t> id;
  if (state.kind == SessionKind::environment && r.kind == ResponseKind::command) id = r.env;
  if (state.kind == SessionKind::proof_state && r.kind == ResponseKind::proof_step) id = r.proof_state;
  if (!id) {
    reject_replay(state, r.kind == ResponseKind::lean_error ? r.error_message : "response carries no " +
                                                                                     to_string(state.kind),
                  warnings);
    return std::nullopt;
  }

  record_minted(r);
  bindings_[state.session_id] = Binding{state.kind, *id};
  stats_.replays_ok.fetch_add(1, std::memory_order_relaxed);
  emit(EventKind::replay, true, ErrorCode::none, state.request_digest, 0, state.session_id, ns, "");
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

Supervisor::Exchange Supervisor::exchange(const Request& wire_request, std::chrono::milliseconds timeout) {
  Exchange ex;
  if (!transport_) {
    ex.error = ErrorCode::transport_tainted;
    ex.detail = "no live transport";
    set_state(SupervisorState::crashed);
    return ex;
  }
  const auto tr = transport_->send(encode_request(wire_request), timeout);
  stats_.bytes_out.fetch_add(tr.bytes_out, std::memory_order_relaxed);
  stats_.bytes_in.fetch_add(tr.bytes_in, std::memory_order_relaxed);
  if (!tr.ok) {
    ex.error = tr.error;
    ex.detail = describe_transport_failure(tr);
    stats_.record_failure(tr.error);
    set_state(SupervisorState::crashed);
    return ex;
  }
  auto decoded = decode_response(tr.unit, wire_request);
  if (!decoded.ok) {
    ex.error = ErrorCode::protocol_error;
    ex.detail = decoded.error;
    stats_.record_failure(ErrorCode::protocol_error);
    set_state(SupervisorState::crashed);
    return ex;
  }
  ex.ok = true;
  ex.response = std::move(decoded.response);
  return ex;
}

void Supervisor::record_minted(const Response& response) {
  for (auto id : response.minted_environments()) minted_envs_.insert(id);
  for (auto id : response.minted_proof_states()) minted_proof_states_.insert(id);
}

void Supervisor::pin_response(const Request& request, Response& response, std::vector<Warning>& warnings,
                              const std::string& digest) {
  SessionKind kind = SessionKind::environment;
  std::optional<int64_t> id;
  if (response.kind == ResponseKind::command && response.env) {
    id = response.env;
  } else if (response.kind == ResponseKind::proof_step && response.proof_state) {
    kind = SessionKind::proof_state;
    id = response.proof_state;
  }
  if (!id) {
    warnings.push_back(Warning{ErrorCode::cache_io_failed, std::nullopt, "response carries no state to pin"});
    return;
  }

  SessionArtifact artifact;
  artifact.kind = kind;
  artifact.strategy = config_.cache_strategy;
  artifact.request_digest = digest;
  const Request logical = to_logical(request);
  if (artifact.strategy == CacheStrategy::replay) {
    // A raw parent id means nothing to the next process.
    for (auto parent : {logical.env, logical.proof_state}) {
      if (!parent || *parent < 0) continue;
      stats_.cache_put_failures.fetch_add(1, std::memory_order_relaxed);
      warnings.push_back(Warning{ErrorCode::invalid_request, std::nullopt,
                                 "cannot pin on unpinned parent " + std::to_string(*parent) +
                                     "; pin the parent first or use the pickle strategy"});
      return;
    }
  }
  artifact.recipe = encode_request(logical);
  const std::string key = cache_->derive_key(artifact);

  if (artifact.strategy == CacheStrategy::pickle) {
    const std::string path = cache_->pickle_path(key);
    const Request pickle = kind == SessionKind::environment ? Request::pickle_environment(path, *id)
                                                            : Request::pickle_proof_state(path, *id);
    auto ex = exchange(pickle, config_.request_timeout);
    if (!ex.ok || ex.response.kind == ResponseKind::lean_error) {
      stats_.cache_put_failures.fetch_add(1, std::memory_order_relaxed);
      warnings.push_back(Warning{ErrorCode::cache_io_failed, std::nullopt,
                                 "pickle failed: " + (ex.ok ? ex.response.error_message : ex.detail)});
      return;
    }
    artifact.recipe = encode_request(kind == SessionKind::environment ? Request::unpickle_environment(path)
                                                                       : Request::unpickle_proof_state(path));
  }

  auto st = cache_->put(key, artifact);
  if (!st) {
    stats_.cache_put_failures.fetch_add(1, std::memory_order_relaxed);
    warnings.push_back(Warning{ErrorCode::cache_io_failed, std::nullopt, "session cache write failed"});
    return;
  }
  stats_.cache_puts.fetch_add(1, std::memory_order_relaxed);
  bindings_[st->session_id] = Binding{kind, *id};
  if (kind == SessionKind::environment) {
    response.env = st->session_id;
  } else {
    response.proof_state = st->session_id;
  }
  log("pinned " + to_string(kind) + " " + std::to_string(*id) + " as session " + std::to_string(st->session_id));

  if (cache_->prune() > 0) {
    std::set<int64_t> live;
    for (const auto& s : cache_->list()) live.insert(s.session_id);
    for (auto it = bindings_.begin(); it != bindings_.end();) {
      it = live.count(it->first) ? std::next(it) : bindings_.erase(it);
    }
  }
}

void Supervisor::check_resources(const std::string& digest) {
  if (!process_ || state() != SupervisorState::idle) return;
  const auto sample = monitor_.sample(process_->pid(), process_->started_at());
  auto breach = monitor_.check(sample);
  if (!breach) return;
  stats_.memory_breaches.fetch_add(1, std::memory_order_relaxed);
  emit(EventKind::breach, false, ErrorCode::memory_limit_exceeded, digest, 0, std::nullopt, 0, breach->describe());
  log("deferred restart: " + breach->describe());
  set_state(SupervisorState::degraded);
}

// ---------------------------------------------------------------------------
// Reporting
// ---------------------------------------------------------------------------

void Supervisor::log(const std::string& message) const {
  if (config_.verbose) log_line(message);
}

void Supervisor::emit(EventKind kind, bool ok, ErrorCode error, const std::string& digest, uint32_t attempt,
                      std::optional<int64_t> session_id, uint64_t duration_ns, const std::string& detail) const {
  SupervisorEvent ev;
  ev.kind = kind;
  ev.generation = generation();
  ev.attempt = attempt;
  ev.ok = ok;
  ev.error = error;
  ev.request_digest = digest;
  ev.session_id = session_id;
  ev.duration_ns = duration_ns;
  ev.detail = detail;
  emit_supervisor_event(ev);
}

RunResult Supervisor::fail(RunResult result, const Failure& f) const {
  result.ok = false;
  result.error = f.code;
  result.cause = f.cause;
  result.stage = f.stage;
  result.detail = f.detail;
  result.generation = generation();
  return result;
}

}  // namespace revenant
