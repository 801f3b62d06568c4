#include "revenant/observability.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include "revenant/jsonlite.hpp"

namespace revenant {

namespace {
std::atomic<SupervisorEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
}  // namespace

void SupervisorStats::record_failure(ErrorCode code) {
  switch (code) {
    case ErrorCode::process_terminated: crashes.fetch_add(1, std::memory_order_relaxed); break;
    case ErrorCode::timeout: timeouts.fetch_add(1, std::memory_order_relaxed); break;
    case ErrorCode::protocol_error: protocol_errors.fetch_add(1, std::memory_order_relaxed); break;
    case ErrorCode::spawn_failed: spawn_failures.fetch_add(1, std::memory_order_relaxed); break;
    default: break;
  }
}

std::string SupervisorStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) { return std::to_string(a.load(std::memory_order_relaxed)); };
  std::string out;
  out.reserve(512);
  out += "{\"requests\":" + n(requests);
  out += ",\"requests_ok\":" + n(requests_ok);
  out += ",\"requests_failed\":" + n(requests_failed);
  out += ",\"dispatch_attempts\":" + n(dispatch_attempts);
  out += ",\"restarts\":" + n(restarts);
  out += ",\"crashes\":" + n(crashes);
  out += ",\"timeouts\":" + n(timeouts);
  out += ",\"protocol_errors\":" + n(protocol_errors);
  out += ",\"spawn_failures\":" + n(spawn_failures);
  out += ",\"memory_breaches\":" + n(memory_breaches);
  out += ",\"replays_ok\":" + n(replays_ok);
  out += ",\"replays_failed\":" + n(replays_failed);
  out += ",\"cache_puts\":" + n(cache_puts);
  out += ",\"cache_put_failures\":" + n(cache_put_failures);
  out += ",\"serializer_contention\":" + n(serializer_contention);
  out += ",\"bytes_out\":" + n(bytes_out);
  out += ",\"bytes_in\":" + n(bytes_in);
  out += '}';
  return out;
}

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::spawn: return "spawn";
    case EventKind::dispatch: return "dispatch";
    case EventKind::restart: return "restart";
    case EventKind::replay: return "replay";
    case EventKind::breach: return "breach";
    case EventKind::give_up: return "give_up";
  }
  return "";
}

std::string SupervisorEvent::to_json() const {
  std::string line;
  line.reserve(256);
  line += "{\"event\":\"";
  line += to_string(kind);
  line += "\",\"generation\":";
  line += std::to_string(generation);
  line += ",\"attempt\":";
  line += std::to_string(attempt);
  line += ",\"ok\":";
  line += ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += to_string(error);
  line += "\",\"request_digest\":\"";
  line += request_digest;
  line += "\"";
  if (session_id) {
    line += ",\"session_id\":";
    line += std::to_string(*session_id);
  }
  line += ",\"duration_ns\":";
  line += std::to_string(duration_ns);
  line += ",\"detail\":\"";
  line += jsonlite::escape(detail);
  line += "\"}";
  return line;
}

void set_supervisor_event_hook(SupervisorEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_supervisor_event(const SupervisorEvent& ev) {
  SupervisorEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("REVENANT_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = ev.to_json() + "\n";
  // O_APPEND keeps short lines whole across writers.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void log_line(const std::string& message) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[revenant] " << message << "\n";
}

}  // namespace revenant
