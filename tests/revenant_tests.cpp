#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "revenant/config.hpp"
#include "revenant/hash.hpp"
#include "revenant/jsonlite.hpp"
#include "revenant/observability.hpp"
#include "revenant/process.hpp"
#include "revenant/protocol.hpp"
#include "revenant/resource_monitor.hpp"
#include "revenant/serializer.hpp"
#include "revenant/session_cache.hpp"
#include "revenant/supervisor.hpp"
#include "revenant/transport.hpp"
#include "revenant/version.hpp"

#ifndef REVENANT_FAKE_REPL_PATH
#define REVENANT_FAKE_REPL_PATH "revenant_fake_repl"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

struct TempDir {
  fs::path path;
  TempDir() {
    std::random_device rd;
    path = fs::temp_directory_path() /
           ("revenant_test_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  std::string file(const std::string& name) const { return (path / name).string(); }
};

revenant::SupervisorConfig fake_config(std::vector<std::string> argv = {}) {
  revenant::SupervisorConfig c;
  c.command = REVENANT_FAKE_REPL_PATH;
  c.argv = std::move(argv);
  c.request_timeout = 10000ms;
  c.replay_timeout = 10000ms;
  c.terminate_grace = 200ms;
  // Host memory pressure must not trigger restarts under test.
  c.max_process_memory = 0.0;
  c.max_system_memory = 0.0;
  return c;
}

revenant::ProcessSpec fake_spec(std::vector<std::string> argv = {}) {
  revenant::ProcessSpec spec;
  spec.command = REVENANT_FAKE_REPL_PATH;
  spec.argv = std::move(argv);
  return spec;
}

std::string first_message(const revenant::Response& r) {
  return r.messages.empty() ? std::string() : r.messages.front().data;
}

// ============================================================================
// Phase 1: JSON and hashing
// ============================================================================

void test_json_parse_and_canonicalize() {
  std::optional<revenant::jsonlite::JsonError> err;
  const auto o = revenant::jsonlite::parse(R"({"b":1,"a":[true,null,"x\u00e9"],"n":-5})", &err);
  expect(!err, "valid JSON must parse");
  expect(revenant::jsonlite::get_i64(o, "n") == -5, "negative integer must decode");
  expect(revenant::jsonlite::get_u64(o, "b", 0) == 1, "unsigned integer must decode");
  const auto* arr = revenant::jsonlite::get_array(o, "a");
  expect(arr && arr->size() == 3, "array must decode");
  expect(std::get<std::string>((*arr)[2].v) == "x\xc3\xa9", "\\u escape must decode to UTF-8");

  const std::string canon = revenant::jsonlite::canonicalize_json(R"({"z":1, "a":{"y":2,"b":3}})", &err);
  expect(!err, "canonicalize must succeed");
  expect(canon == R"({"a":{"b":3,"y":2},"z":1})", "canonical form sorts keys without whitespace");
}

void test_json_rejects_malformed() {
  std::optional<revenant::jsonlite::JsonError> err;
  (void)revenant::jsonlite::parse("{\"a\":", &err);
  expect(err.has_value(), "truncated JSON must fail");

  err.reset();
  (void)revenant::jsonlite::parse("{\"a\":\"line\nbreak\"}", &err);
  expect(err.has_value(), "raw control character in string must fail");

  err.reset();
  (void)revenant::jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "top-level array is not an object");

  err.reset();
  const std::string deep = "{\"a\":" + std::string(600, '[') + std::string(600, ']') + "}";
  (void)revenant::jsonlite::parse(deep, &err);
  expect(err.has_value(), "excessive nesting must fail");
}

void test_blake3_known_vectors() {
  expect(revenant::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(revenant::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"cmd\":\"def x := 1\"}";
  const auto req = revenant::request_digest(payload);
  const auto sess = revenant::session_key_hash(payload);
  const auto blob = revenant::blob_hash(payload);
  expect(req != sess && sess != blob && req != blob, "hash domains must not collide");
  expect(revenant::valid_digest(req), "request digest must be 64 lowercase hex");
  expect(!revenant::valid_digest("ABC"), "short digest is invalid");
  expect(revenant::request_digest(payload) == req, "request digest is deterministic");
}

void test_version_manifest() {
  const auto m = revenant::version::current_manifest();
  const auto json = revenant::version::manifest_to_json(m);
  std::optional<revenant::jsonlite::JsonError> err;
  (void)revenant::jsonlite::parse(json, &err);
  expect(!err, "manifest is a JSON object");
  expect(m.session_cache_format == revenant::version::SESSION_CACHE_FORMAT_VERSION, "cache format reported");
  expect(m.hash_primitive == "blake3", "hash primitive reported");
  expect(revenant::version::session_cache_compatible(revenant::version::SESSION_CACHE_FORMAT_VERSION),
         "current cache format is compatible");
  expect(!revenant::version::session_cache_compatible(revenant::version::SESSION_CACHE_FORMAT_VERSION + 1),
         "future cache format is rejected");
}

// ============================================================================
// Phase 2: Wire protocol
// ============================================================================

void test_encode_command_request() {
  auto req = revenant::Request::command("def x := 1", 0);
  req.all_tactics = true;
  req.options[revenant::OptionKey::parse("pp.all")] = revenant::OptionValue{true};
  req.options[revenant::OptionKey::parse("maxHeartbeats")] = revenant::OptionValue{int64_t{0}};
  req.options[revenant::OptionKey::parse("trace.profiler.output")] =
      revenant::OptionValue{revenant::OptionName{"foo.bar"}};
  const std::string json = revenant::encode_request(req);
  expect(json.find("\"cmd\":\"def x := 1\"") != std::string::npos, "cmd field");
  expect(json.find("\"env\":0") != std::string::npos, "env field");
  expect(json.find("\"allTactics\":true") != std::string::npos, "allTactics flag");
  expect(json.find("\"rootGoals\"") == std::string::npos, "unset flags are omitted");
  expect(json.find("\"pp.all\":true") != std::string::npos, "bool option");
  expect(json.find("\"maxHeartbeats\":0") != std::string::npos, "int option");
  expect(json.find("\"`foo.bar\"") != std::string::npos, "name option is a name literal");

  const auto step = revenant::encode_request(revenant::Request::proof_step("rfl", 3));
  expect(step == "{\"proofState\":3,\"tactic\":\"rfl\"}", "proof step encoding: " + step);
}

void test_decode_request_shapes() {
  std::string err;
  auto r = revenant::decode_request("{\"tactic\":\"simp\",\"proofState\":-2}", &err);
  expect(r && r->kind == revenant::RequestKind::proof_step, "tactic decodes as proof_step");
  expect(r->proof_state == -2, "negative proof state survives");

  r = revenant::decode_request("{\"pickleTo\":\"/tmp/x.olean\",\"env\":4}", &err);
  expect(r && r->kind == revenant::RequestKind::pickle_environment, "pickle env shape");

  r = revenant::decode_request("{\"unpickleProofStateFrom\":\"/tmp/p.olean\"}", &err);
  expect(r && r->kind == revenant::RequestKind::unpickle_proof_state, "unpickle proof state shape");

  r = revenant::decode_request("{\"what\":1}", &err);
  expect(!r && !err.empty(), "unknown shape is rejected");
}

void test_decode_command_response() {
  const auto req = revenant::Request::command("theorem t : True := sorry");
  const std::string unit =
      R"({"env":2,"messages":[{"severity":"warning","pos":{"line":1,"column":0},)"
      R"("endPos":{"line":1,"column":5},"data":"declaration uses 'sorry'"}],)"
      R"("sorries":[{"pos":{"line":1,"column":20},"goal":"⊢ True","proofState":7}]})";
  const auto d = revenant::decode_response(unit, req);
  expect(d.ok, "command response decodes: " + d.error);
  expect(d.response.kind == revenant::ResponseKind::command, "kind is command");
  expect(d.response.env == 2, "env id");
  expect(d.response.messages.size() == 1 && d.response.messages[0].severity == "warning", "messages");
  expect(d.response.messages[0].end_pos.has_value(), "endPos decoded");
  expect(!d.response.has_errors(), "warnings are not errors");
  expect(d.response.sorries.size() == 1 && d.response.sorries[0].proof_state == 7, "sorries");
  const auto ps = d.response.minted_proof_states();
  expect(ps.size() == 1 && ps[0] == 7, "sorry proof state counts as minted");
  const auto envs = d.response.minted_environments();
  expect(envs.size() == 1 && envs[0] == 2, "env counts as minted");
}

void test_decode_lean_error() {
  const auto d = revenant::decode_response("{\"message\":\"Unknown environment.\"}",
                                           revenant::Request::command("x", 9));
  expect(d.ok, "LeanError is a valid response");
  expect(d.response.kind == revenant::ResponseKind::lean_error, "kind is lean_error");
  expect(d.response.error_message == "Unknown environment.", "message");
}

void test_flag_gated_fields() {
  const std::string unit =
      R"({"env":0,"tactics":[{"tactic":"rfl","goals":"⊢ 1 = 1","proofState":4}],"infotree":[]})";
  auto plain = revenant::Request::command("example : 1 = 1 := by rfl");
  auto d = revenant::decode_response(unit, plain);
  expect(d.ok && !d.response.tactics_json && !d.response.infotree_json, "unrequested fields are dropped");

  auto flagged = plain;
  flagged.all_tactics = true;
  flagged.infotree = revenant::InfoTreeMode::original;
  d = revenant::decode_response(unit, flagged);
  expect(d.ok && d.response.tactics_json.has_value(), "tactics kept when requested");
  expect(d.response.infotree_json == std::string("[]"), "infotree kept when requested");
  expect(d.response.tactic_proof_states.size() == 1 && d.response.tactic_proof_states[0] == 4,
         "tactic proof states collected");
}

void test_root_goals_fallback() {
  auto req = revenant::Request::command("theorem t : 2 = 2 := sorry");
  req.root_goals = true;
  const std::string unit = R"({"env":0,"sorries":[{"pos":{"line":1,"column":0},"goal":"⊢ 2 = 2","proofState":0}]})";
  const auto d = revenant::decode_response(unit, req);
  expect(d.ok && d.response.root_goals.has_value(), "root goals requested");
  expect(d.response.root_goals->size() == 1 && (*d.response.root_goals)[0] == "⊢ 2 = 2",
         "root goals derived from sorries");
}

void test_decode_malformed_response() {
  const auto req = revenant::Request::command("x");
  expect(!revenant::decode_response("{\"env\":\"zero\"}", req).ok, "string env is malformed");
  expect(!revenant::decode_response("{\"env\":0,\"messages\":5}", req).ok, "non-array messages");
  expect(!revenant::decode_response("not json", req).ok, "non-JSON unit");
}

void test_proof_step_response_kind() {
  const auto d = revenant::decode_response(R"({"proofState":3,"goals":[],"proofStatus":"Completed"})",
                                           revenant::Request::proof_step("rfl", 1));
  expect(d.ok && d.response.kind == revenant::ResponseKind::proof_step, "proof step kind");
  expect(d.response.proof_status == "Completed" && d.response.goals.empty(), "proof status");
}

void test_frame_assembler() {
  revenant::FrameAssembler fa;
  fa.feed("\n{\"env\"");
  expect(!fa.next().has_value(), "partial unit is not emitted");
  expect(fa.has_partial(), "partial unit is buffered");
  fa.feed(":0}\n");
  expect(!fa.next().has_value(), "unit needs its blank line");
  fa.feed("\n{\"a\":\n1}\n\n");
  auto u1 = fa.next();
  auto u2 = fa.next();
  expect(u1 && *u1 == "{\"env\":0}\n", "first unit: " + u1.value_or(""));
  expect(u2 && *u2 == "{\"a\":\n1}\n", "multi-line unit");
  expect(!fa.next().has_value() && !fa.has_partial(), "buffer drained");

  revenant::FrameAssembler small(16);
  small.feed(std::string(32, 'x'));
  expect(small.overflowed(), "size bound enforced");
}

void test_frame_assembler_chunked_unit() {
  revenant::FrameAssembler fa;
  std::string expected;
  for (int i = 0; i < 2000; ++i) {
    const std::string line = "  \"k" + std::to_string(i) + "\": " + std::to_string(i) + ",\n";
    expected += line;
    // Split each line across two feeds so scanning resumes mid-line.
    fa.feed(line.substr(0, 3));
    expect(!fa.next().has_value(), "no unit before its blank line");
    fa.feed(line.substr(3));
    expect(!fa.next().has_value(), "no unit before its blank line");
  }
  fa.feed("\n{\"env\":1}\n\n");
  auto big = fa.next();
  expect(big && *big == expected, "chunked unit reassembled intact");
  auto tail = fa.next();
  expect(tail && *tail == "{\"env\":1}\n", "following unit intact");
  fa.feed("{\"x\":1}\n");
  expect(!fa.next().has_value(), "partial after reuse");
  fa.clear();
  fa.feed("\n{\"y\":2}\n\n");
  auto fresh = fa.next();
  expect(fresh && *fresh == "{\"y\":2}\n", "clear resets the scan position");
}

// ============================================================================
// Phase 3: Options and configuration
// ============================================================================

void test_option_keys() {
  const auto k = revenant::OptionKey::parse("pp.all");
  expect(k.segments.size() == 2 && k.to_string() == "pp.all", "dotted key round trip");
  expect(k.valid(), "pp.all is valid");
  expect(!revenant::OptionKey::parse("1abc").valid(), "leading digit is invalid");
  expect(!revenant::OptionKey::parse("pp..all").valid(), "empty segment is invalid");
  expect(revenant::OptionKey::parse("h'").valid(), "primes are allowed");

  revenant::OptionMap defaults;
  defaults[revenant::OptionKey::parse("pp.all")] = revenant::OptionValue{false};
  defaults[revenant::OptionKey::parse("maxHeartbeats")] = revenant::OptionValue{int64_t{200000}};
  revenant::OptionMap overrides;
  overrides[revenant::OptionKey::parse("pp.all")] = revenant::OptionValue{true};
  const auto merged = revenant::overlay_options(defaults, overrides);
  expect(merged.size() == 2, "overlay keeps defaults");
  expect(std::get<bool>(merged.at(revenant::OptionKey::parse("pp.all"))), "caller wins");

  revenant::OptionMap bad;
  bad[revenant::OptionKey::parse("9x")] = revenant::OptionValue{true};
  expect(revenant::invalid_option_keys(bad).size() == 1, "invalid key reported");
}

void test_effective_default_options() {
  revenant::SupervisorConfig c;
  expect(c.effective_default_options().empty(), "no switches off, no options");
  c.enable_parallel_elaboration = false;
  c.enable_incremental_optimization = false;
  const auto opts = c.effective_default_options();
  expect(opts.size() == 2, "both elaboration switches map to options");
  expect(!std::get<bool>(opts.at(revenant::OptionKey::parse("Elab.async"))), "Elab.async=false");
  expect(!std::get<bool>(opts.at(revenant::OptionKey::parse("Elab.incremental"))), "Elab.incremental=false");
}

void test_config_from_env() {
  ::setenv("REVENANT_REPL_COMMAND", "lake exe repl --quiet", 1);
  ::setenv("REVENANT_TIMEOUT_MS", "1234", 1);
  ::setenv("REVENANT_MAX_ATTEMPTS", "5", 1);
  ::setenv("REVENANT_CACHE_STRATEGY", "pickle", 1);
  ::setenv("REVENANT_MAX_SYSTEM_MEMORY", "0.5", 1);
  const auto c = revenant::SupervisorConfig::from_env();
  revenant::SupervisorConfig base;
  base.replay_timeout = 5000ms;
  const auto layered = revenant::SupervisorConfig::from_env(base);
  ::unsetenv("REVENANT_REPL_COMMAND");
  ::unsetenv("REVENANT_TIMEOUT_MS");
  ::unsetenv("REVENANT_MAX_ATTEMPTS");
  ::unsetenv("REVENANT_CACHE_STRATEGY");
  ::unsetenv("REVENANT_MAX_SYSTEM_MEMORY");

  expect(c.command == "lake", "command from env");
  expect(c.argv.size() == 3 && c.argv[2] == "--quiet", "argv from env");
  expect(c.request_timeout == 1234ms, "timeout from env");
  expect(c.max_attempts == 5, "max attempts from env");
  expect(c.cache_strategy == revenant::CacheStrategy::pickle, "cache strategy from env");
  expect(c.max_system_memory == 0.5, "system memory limit from env");
  expect(c.replay_timeout == 60000ms, "unset variables keep defaults");
  expect(layered.replay_timeout == 5000ms && layered.max_attempts == 5, "env overlays an explicit base");
}

void test_config_json() {
  std::string err;
  const auto c = revenant::parse_config_json(
      R"({"command":"repl","argv":[],"request_timeout_ms":500,"cache_max_entries":7,)"
      R"("default_options":{"pp.all":true,"maxHeartbeats":1000},"bogus":1})",
      revenant::SupervisorConfig{}, &err);
  expect(c.command == "repl" && c.argv.empty(), "command and argv");
  expect(c.request_timeout == 500ms, "duration in ms");
  expect(c.cache_retention.max_entries == 7, "retention");
  expect(c.default_options.size() == 2, "default options decoded");
  expect(err.find("unknown key: bogus") != std::string::npos, "unknown key reported: " + err);

  std::string err2;
  const auto round = revenant::parse_config_json(revenant::config_to_json(c), revenant::SupervisorConfig{}, &err2);
  expect(err2.empty(), "serialized config re-parses cleanly: " + err2);
  expect(round.request_timeout == 500ms && round.default_options.size() == 2, "config survives serialization");
}

void test_config_validation() {
  auto c = fake_config();
  expect(revenant::validate_config(c).ok, "fake config is valid");
  c.max_attempts = 0;
  c.max_system_memory = 1.5;
  const auto v = revenant::validate_config(c);
  expect(!v.ok && v.errors.size() == 2, "two errors reported");

  revenant::Supervisor sup(c);
  const auto r = sup.run(revenant::Request::command("def x := 1"));
  expect(!r.ok && r.error == revenant::ErrorCode::config_invalid, "invalid config refuses to run");
  expect(r.attempts == 0, "nothing dispatched");
}

// ============================================================================
// Phase 4: Request serializer
// ============================================================================

void test_serializer_mutual_exclusion() {
  revenant::RequestSerializer gate;
  std::atomic<int> inside{0};
  std::atomic<bool> overlap{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        auto g = gate.acquire();
        if (!g.held()) continue;
        if (inside.fetch_add(1) != 0) overlap = true;
        std::this_thread::yield();
        inside.fetch_sub(1);
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(!overlap.load(), "no two holders at once");
  expect(gate.admitted() == 400, "every acquisition admitted");
}

void test_serializer_guard_release() {
  revenant::RequestSerializer gate;
  auto g = gate.acquire();
  expect(g.held(), "first acquire holds");
  auto moved = std::move(g);
  expect(!g.held() && moved.held(), "ownership moves");
  moved.release();
  expect(!moved.held(), "released");
  auto again = gate.acquire();
  expect(again.held(), "gate reusable after release");
}

void test_serializer_cross_process() {
  revenant::RequestSerializer gate;
  const pid_t child = ::fork();
  if (child == 0) {
    auto g = gate.acquire();
    ::_exit(g.held() ? 1 : 0);
  }
  int status = 0;
  ::waitpid(child, &status, 0);
  expect(WIFEXITED(status) && WEXITSTATUS(status) == 0, "forked child is refused the gate");
}

// ============================================================================
// Phase 5: Resource monitor
// ============================================================================

void test_monitor_fake_probe() {
  auto probe = [](pid_t) {
    revenant::MemoryReading m;
    m.valid = true;
    m.process_rss_bytes = 900;
    m.system_total_bytes = 1000;
    m.system_available_bytes = 500;
    return m;
  };
  const auto started = std::chrono::steady_clock::now();

  revenant::ResourceMonitor proc({0.8, 0.0, 0, 0ms}, probe);
  auto b = proc.check(proc.sample(1, started));
  expect(b && b->kind == revenant::BreachKind::process_memory, "process breach");
  expect(!b->describe().empty(), "breach describes itself");

  revenant::ResourceMonitor sys({0.0, 0.4, 0, 0ms}, probe);
  b = sys.check(sys.sample(1, started));
  expect(b && b->kind == revenant::BreachKind::system_memory, "system breach");

  revenant::ResourceMonitor ceiling({0.8, 0.0, 2000, 0ms}, probe);
  const auto s = ceiling.sample(1, started);
  expect(s.valid && s.process_memory_fraction == 0.45, "fraction of hard ceiling");
  expect(!ceiling.check(s), "under the ceiling");

  revenant::ResourceMonitor off({0.0, 0.0, 0, 0ms}, probe);
  expect(!off.check(off.sample(1, started)), "zero limits disable checks");
}

void test_monitor_uptime() {
  auto probe = [](pid_t) { return revenant::MemoryReading{}; };
  revenant::ResourceMonitor m({0.0, 0.0, 0, 5ms}, probe);
  const auto s = m.sample(1, std::chrono::steady_clock::now() - 50ms);
  expect(!s.valid, "invalid reading");
  auto b = m.check(s);
  expect(b && b->kind == revenant::BreachKind::uptime, "uptime checked without memory data");
}

void test_monitor_reads_proc() {
  revenant::ProcessSpec spec;
  spec.command = "sleep";
  spec.argv = {"5"};
  std::string err;
  auto p = revenant::ProcessHandle::spawn(spec, &err);
  expect(p != nullptr, "spawn sleep: " + err);
  const auto m = revenant::ResourceMonitor::read_proc(p->pid());
  expect(m.valid, "process group readable from /proc");
  expect(m.system_total_bytes > 0 && m.process_rss_bytes > 0, "non-zero readings");
  p->terminate(100ms);
}

// ============================================================================
// Phase 6: Session cache
// ============================================================================

revenant::SessionArtifact artifact(const std::string& recipe,
                                   revenant::SessionKind kind = revenant::SessionKind::environment) {
  revenant::SessionArtifact a;
  a.kind = kind;
  a.recipe = recipe;
  a.request_digest = revenant::request_digest(recipe);
  return a;
}

void test_cache_put_get_list() {
  TempDir dir;
  revenant::SessionCache cache(dir.path.string());
  const auto a = artifact("{\"cmd\":\"def x := 1\"}");
  const auto b = artifact("{\"proofState\":-1,\"tactic\":\"intro\"}", revenant::SessionKind::proof_state);
  const auto ka = cache.derive_key(a);
  const auto kb = cache.derive_key(b);
  expect(revenant::valid_session_key(ka) && ka != kb, "derived keys are distinct digests");

  auto sa = cache.put(ka, a);
  auto sb = cache.put(kb, b);
  expect(sa && sa->session_id == -1, "first session id is -1");
  expect(sb && sb->session_id == -2, "second session id is -2");
  expect(sb->sequence > sa->sequence, "sequence increases");

  auto got = cache.get(ka);
  expect(got && got->recipe == a.recipe, "recipe round trip");
  expect(got->stored_blob_hash == revenant::blob_hash(a.recipe), "blob hash recorded");
  auto found = cache.find_session(-2);
  expect(found && found->kind == revenant::SessionKind::proof_state, "lookup by session id");

  const auto all = cache.list();
  expect(all.size() == 2 && all[0].session_id == -1 && all[1].session_id == -2, "list in creation order");

  auto again = cache.put(ka, artifact("{\"cmd\":\"def x := 2\"}"));
  expect(again && again->session_id == -1, "re-put keeps the session id");
  expect(!cache.put("not-a-key", a), "invalid key rejected");
}

void test_cache_persistence() {
  TempDir dir;
  {
    revenant::SessionCache cache(dir.path.string());
    const auto a = artifact("{\"cmd\":\"def a := 1\"}");
    expect(cache.put(cache.derive_key(a), a).has_value(), "put");
  }
  revenant::SessionCache reopened(dir.path.string());
  const auto all = reopened.list();
  expect(all.size() == 1 && all[0].session_id == -1, "entry survives reopen");
  const auto b = artifact("{\"cmd\":\"def b := 2\"}");
  auto sb = reopened.put(reopened.derive_key(b), b);
  expect(sb && sb->session_id == -2, "ids continue after reopen");

  expect(reopened.clear(all[0].key), "clear");
  expect(reopened.clear_all() == 1, "clear_all removes remaining");
  const auto c = artifact("{\"cmd\":\"def c := 3\"}");
  auto sc = reopened.put(reopened.derive_key(c), c);
  expect(sc && sc->session_id == -3, "ids are never reused");
}

void test_cache_corruption_detection() {
  TempDir dir;
  revenant::SessionCache cache(dir.path.string());
  const auto a = artifact("{\"cmd\":\"def x := 1\"}");
  const auto key = cache.derive_key(a);
  expect(cache.put(key, a).has_value(), "put");

  std::string state_file;
  for (const auto& entry : fs::recursive_directory_iterator(dir.path)) {
    if (entry.path().extension() == ".state") state_file = entry.path().string();
  }
  expect(!state_file.empty(), "state file on disk");
  {
    std::ofstream ofs(state_file, std::ios::binary | std::ios::trunc);
    ofs << "{\"cmd\":\"def x := 666\"}";
  }
  expect(!cache.get(key).has_value(), "tampered entry fails closed");
  expect(cache.list().empty(), "tampered entry is not listed");
}

void test_cache_concurrent_writers() {
  TempDir dir;
  constexpr int kWriters = 2;
  constexpr int kPuts = 40;
  std::vector<pid_t> children;
  for (int w = 0; w < kWriters; ++w) {
    const pid_t pid = ::fork();
    expect(pid >= 0, "fork");
    if (pid == 0) {
      revenant::SessionCache cache(dir.path.string());
      int rc = 0;
      for (int i = 0; i < kPuts; ++i) {
        const auto a = artifact("{\"cmd\":\"def w" + std::to_string(w) + "_" + std::to_string(i) + " := 1\"}");
        if (!cache.put(cache.derive_key(a), a)) rc = 1;
      }
      std::_Exit(rc);
    }
    children.push_back(pid);
  }
  for (const pid_t pid : children) {
    int status = 0;
    expect(::waitpid(pid, &status, 0) == pid, "writer reaped");
    expect(WIFEXITED(status) && WEXITSTATUS(status) == 0, "every put succeeded");
  }

  revenant::SessionCache cache(dir.path.string());
  const auto all = cache.list();
  std::set<int64_t> ids;
  std::set<uint64_t> sequences;
  for (const auto& st : all) {
    ids.insert(st.session_id);
    sequences.insert(st.sequence);
  }
  expect(all.size() == static_cast<std::size_t>(kWriters * kPuts), "all entries stored");
  expect(ids.size() == all.size(), "session ids unique across writer processes");
  expect(sequences.size() == all.size(), "sequences unique across writer processes");
  for (const auto& st : all) {
    auto found = cache.find_session(st.session_id);
    expect(found && found->key == st.key, "session id resolves to its own entry");
  }
}

void test_cache_index_tracks_changes() {
  TempDir dir;
  revenant::SessionCache writer(dir.path.string());
  revenant::SessionCache reader(dir.path.string());
  const auto a = artifact("{\"cmd\":\"def a := 1\"}");
  const auto ka = writer.derive_key(a);
  expect(writer.put(ka, a).has_value(), "put");
  expect(reader.list().size() == 1, "reader sees the entry");
  const auto b = artifact("{\"cmd\":\"def b := 2\"}");
  expect(writer.put(writer.derive_key(b), b).has_value(), "second put");
  auto found = reader.find_session(-2);
  expect(found && found->recipe == b.recipe, "reader index picks up new entries");
  const auto a2 = artifact("{\"cmd\":\"def a := 10\"}");
  expect(writer.put(ka, a2).has_value(), "rewrite");
  found = reader.find_session(-1);
  expect(found && found->recipe == a2.recipe, "rewritten entry re-read");
  expect(writer.clear(ka), "clear");
  expect(!reader.find_session(-1).has_value() && reader.list().size() == 1, "removed entry dropped");
}

void test_cache_eviction() {
  TempDir dir;
  revenant::CacheRetention retention;
  retention.max_entries = 2;
  revenant::SessionCache cache(dir.path.string(), retention);
  for (int i = 0; i < 3; ++i) {
    const auto a = artifact("{\"cmd\":\"def v" + std::to_string(i) + " := 1\"}");
    expect(cache.put(cache.derive_key(a), a).has_value(), "put");
  }
  expect(cache.prune() == 1, "oldest entry evicted");
  const auto all = cache.list();
  expect(all.size() == 2 && all[0].session_id == -2 && all[1].session_id == -3, "newest entries kept");
}

// ============================================================================
// Phase 7: Process and transport
// ============================================================================

void test_spawn_failure_reported() {
  revenant::ProcessSpec spec;
  spec.command = "/nonexistent/revenant-no-such-binary";
  std::string err;
  auto p = revenant::ProcessHandle::spawn(spec, &err);
  expect(p == nullptr, "spawn of missing binary fails");
  expect(!err.empty(), "spawn error is described");
}

void test_transport_roundtrip() {
  for (const bool pretty : {false, true}) {
    std::string err;
    auto p = revenant::ProcessHandle::spawn(fake_spec(pretty ? std::vector<std::string>{"--pretty"}
                                                             : std::vector<std::string>{}),
                                            &err);
    expect(p != nullptr, "spawn fake repl: " + err);
    revenant::Transport t(*p);
    auto r = t.send("{\"cmd\":\"def x := 1\"}", 5000ms);
    expect(r.ok, "round trip: " + r.detail);
    auto d = revenant::decode_response(r.unit, revenant::Request::command("def x := 1"));
    expect(d.ok && d.response.env == 0, "first env is 0");
    r = t.send("{\"cmd\":\"#eval x + 41\",\"env\":0}", 5000ms);
    d = revenant::decode_response(r.unit, revenant::Request::command("#eval x + 41", 0));
    expect(r.ok && d.ok && first_message(d.response) == "42", "definitions carry over");
    expect(r.bytes_out > 0 && r.bytes_in > 0, "byte counts");
  }
}

void test_transport_timeout_taints() {
  std::string err;
  auto p = revenant::ProcessHandle::spawn(fake_spec(), &err);
  expect(p != nullptr, "spawn");
  revenant::Transport t(*p);
  const auto r = t.send("{\"cmd\":\"#hang\"}", 200ms);
  expect(!r.ok && r.error == revenant::ErrorCode::timeout, "hang times out");
  expect(t.tainted(), "transport tainted after timeout");
  const auto again = t.send("{\"cmd\":\"def x := 1\"}", 200ms);
  expect(again.error == revenant::ErrorCode::transport_tainted, "tainted transport refuses work");
}

void test_transport_crash() {
  std::string err;
  auto p = revenant::ProcessHandle::spawn(fake_spec(), &err);
  expect(p != nullptr, "spawn");
  revenant::Transport t(*p);
  const auto r = t.send("{\"cmd\":\"#crash\"}", 5000ms);
  expect(!r.ok && r.error == revenant::ErrorCode::process_terminated, "crash detected");
  expect(r.exit_code == 1, "exit code captured");
  struct sigaction current;
  expect(sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_IGN,
         "default SIGPIPE replaced so writes to a dead child report EPIPE");
}

void test_transport_garbage() {
  std::string err;
  auto p = revenant::ProcessHandle::spawn(fake_spec(), &err);
  expect(p != nullptr, "spawn");
  revenant::Transport t(*p);
  const auto r = t.send("{\"cmd\":\"#garbage\"}", 5000ms);
  expect(!r.ok && r.error == revenant::ErrorCode::protocol_error, "non-JSON unit is a protocol error");
}

void test_transport_stderr_tail() {
  std::string err;
  auto p = revenant::ProcessHandle::spawn(fake_spec(), &err);
  expect(p != nullptr, "spawn");
  revenant::Transport t(*p);
  const auto r = t.send("{\"cmd\":\"#stderr elaborator noise\"}", 5000ms);
  expect(r.ok, "stderr does not break the exchange");
  std::this_thread::sleep_for(50ms);
  t.drain_stderr();
  expect(t.stderr_tail().find("elaborator noise") != std::string::npos, "stderr captured");
}

// ============================================================================
// Phase 8: Supervisor
// ============================================================================

void test_supervisor_basic_dispatch() {
  revenant::Supervisor sup(fake_config());
  expect(sup.state() == revenant::SupervisorState::idle && sup.generation() == 0, "lazy start");
  auto r = sup.run(revenant::Request::command("def x := 1"));
  expect(r.ok && r.response.env == 0, "first command: " + r.detail);
  expect(r.generation == 1 && r.attempts == 1, "one dispatch on generation 1");
  expect(revenant::valid_digest(r.request_digest), "request digest reported");
  r = sup.run(revenant::Request::command("#eval x", 0));
  expect(r.ok && first_message(r.response) == "1", "child environment sees parent definitions");
  expect(sup.is_alive(), "process alive");
  expect(sup.stats().requests_ok.load() == 2, "stats count successes");
}

void test_supervisor_lean_error_is_ok() {
  auto c = fake_config();
  c.strict_id_tracking = false;
  revenant::Supervisor sup(c);
  const auto r = sup.run(revenant::Request::command("#eval 1", 99));
  expect(r.ok, "LeanError is a successful exchange");
  expect(r.response.kind == revenant::ResponseKind::lean_error, "kind lean_error");
  expect(r.response.error_message == "Unknown environment.", "prover message kept");
}

void test_supervisor_validation_errors() {
  revenant::Supervisor sup(fake_config());
  auto r = sup.run(revenant::Request::command(""));
  expect(r.error == revenant::ErrorCode::invalid_request && r.stage == revenant::FailureStage::validate,
         "empty text rejected");

  auto bad = revenant::Request::command("def x := 1");
  bad.options[revenant::OptionKey::parse("9bad")] = revenant::OptionValue{true};
  r = sup.run(bad);
  expect(r.error == revenant::ErrorCode::invalid_request, "invalid option key rejected");

  r = sup.run(revenant::Request::command("#eval 1", 5));
  expect(r.error == revenant::ErrorCode::unknown_parent, "unminted id rejected");

  r = sup.run(revenant::Request::command("#eval 1", -42));
  expect(r.error == revenant::ErrorCode::unknown_session, "unknown session rejected");
  expect(r.attempts == 0 && sup.generation() == 0, "validation never dispatches");
}

void test_supervisor_pin_survives_crash() {
  revenant::Supervisor sup(fake_config());
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("def x := 1"), pin);
  expect(r.ok && r.response.env == -1, "pinned env reports session id -1");
  auto plain = sup.run(revenant::Request::command("def y := 2"));
  expect(plain.ok && plain.response.env.has_value(), "unpinned env");
  const int64_t raw = *plain.response.env;

  r = sup.run(revenant::Request::command("#crash"));
  expect(!r.ok && r.error == revenant::ErrorCode::restart_attempts_exhausted, "crash loop gives up");
  expect(r.cause == revenant::ErrorCode::process_terminated, "cause is the crash");
  expect(r.attempts == 3, "bounded by max_attempts");

  r = sup.run(revenant::Request::command("#eval y", raw));
  expect(r.error == revenant::ErrorCode::unknown_parent, "unpinned id dies with its generation");

  r = sup.run(revenant::Request::command("#eval x + 1", -1));
  expect(r.ok && first_message(r.response) == "2", "pinned env restored after restart: " + r.detail);
  expect(sup.stats().replays_ok.load() >= 1, "replay counted");
  expect(sup.stats().restarts.load() >= 1, "restart counted");

}

void test_supervisor_recovers_from_single_crash() {
  TempDir dir;
  revenant::Supervisor sup(fake_config());
  const auto r = sup.run(revenant::Request::command("#crash_once " + dir.file("marker")));
  expect(r.ok, "request succeeds on retry: " + r.detail);
  expect(r.attempts == 2 && r.generation == 2, "one restart");
  expect(sup.stats().crashes.load() == 1, "crash counted");
}

void test_supervisor_always_crash() {
  revenant::Supervisor sup(fake_config({"--crash-always"}));
  const auto r = sup.run(revenant::Request::command("def x := 1"));
  expect(!r.ok && r.error == revenant::ErrorCode::restart_attempts_exhausted, "gives up");
  expect(r.attempts == 3 && r.cause == revenant::ErrorCode::process_terminated, "three attempts");
  expect(r.stage == revenant::FailureStage::dispatch, "failed during dispatch");
}

void test_supervisor_spawn_failure() {
  auto c = fake_config();
  c.command = "/nonexistent/revenant-no-such-binary";
  revenant::Supervisor sup(c);
  const auto r = sup.start();
  expect(!r.ok && r.error == revenant::ErrorCode::restart_attempts_exhausted, "spawn failures exhaust");
  expect(r.cause == revenant::ErrorCode::spawn_failed, "cause spawn_failed");
  expect(sup.stats().spawn_failures.load() == 3, "each attempt counted");
}

void test_supervisor_timeout_then_restart() {
  revenant::Supervisor sup(fake_config());
  revenant::RunOptions opts;
  opts.timeout = 200ms;
  auto r = sup.run(revenant::Request::command("#hang"), opts);
  expect(!r.ok && r.error == revenant::ErrorCode::timeout, "timeout surfaced");
  expect(r.attempts == 1 && r.stage == revenant::FailureStage::dispatch, "timeouts are not retried");
  r = sup.run(revenant::Request::command("def z := 1"));
  expect(r.ok && r.generation == 2, "next request runs on a fresh process");
}

void test_supervisor_retry_on_timeout() {
  auto c = fake_config();
  c.retry_on_timeout = true;
  c.max_attempts = 2;
  revenant::Supervisor sup(c);
  revenant::RunOptions opts;
  opts.timeout = 150ms;
  const auto r = sup.run(revenant::Request::command("#hang"), opts);
  expect(r.error == revenant::ErrorCode::restart_attempts_exhausted, "retried then gave up");
  expect(r.cause == revenant::ErrorCode::timeout && r.attempts == 2, "cause timeout");
}

void test_supervisor_protocol_error() {
  revenant::Supervisor sup(fake_config());
  const auto r = sup.run(revenant::Request::command("#garbage"));
  expect(r.error == revenant::ErrorCode::restart_attempts_exhausted, "garbage every time");
  expect(r.cause == revenant::ErrorCode::protocol_error, "cause protocol_error");
  expect(sup.stats().protocol_errors.load() == 3, "each protocol error counted");
}

void test_supervisor_replay_failure_warning() {
  TempDir dir;
  revenant::Supervisor sup(fake_config());
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("#once " + dir.file("once")), pin);
  expect(r.ok && r.response.env == -1, "pinned");
  r = sup.restart();
  expect(r.ok, "restart succeeds");
  expect(r.warnings.size() == 1 && r.warnings[0].code == revenant::ErrorCode::cache_replay_failed,
         "replay failure is a warning");
  expect(r.warnings[0].session_id == -1, "warning names the session");
  expect(sup.pinned_states().empty(), "failed entry discarded");
  r = sup.run(revenant::Request::command("#eval 1", -1));
  expect(r.error == revenant::ErrorCode::unknown_session, "discarded session is unknown");
}

void test_supervisor_replay_crash_discards_state() {
  TempDir dir;
  auto cache = std::make_shared<revenant::SessionCache>(dir.path.string());
  auto c = fake_config();
  c.replay_timeout = 300ms;
  revenant::Supervisor sup(c, cache);
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("def x := 1"), pin);
  expect(r.ok && r.response.env == -1, "healthy pin");
  const auto crash = artifact("{\"cmd\":\"#crash\"}");
  const auto hang = artifact("{\"cmd\":\"#hang\"}");
  expect(cache->put(cache->derive_key(crash), crash).has_value(), "crashing recipe stored");
  expect(cache->put(cache->derive_key(hang), hang).has_value(), "hanging recipe stored");

  r = sup.restart();
  expect(r.ok, "restart succeeds despite replays that kill the process: " + r.detail);
  expect(r.warnings.size() == 2, "one warning per discarded state");
  expect(r.warnings[0].code == revenant::ErrorCode::cache_replay_failed && r.warnings[0].session_id == -2,
         "crashing state discarded");
  expect(r.warnings[1].code == revenant::ErrorCode::cache_replay_failed && r.warnings[1].session_id == -3,
         "hanging state discarded");
  const auto states = sup.pinned_states();
  expect(states.size() == 1 && states[0].session_id == -1, "only the healthy state remains");
  expect(sup.stats().replays_failed.load() == 2, "failed replays counted");

  r = sup.run(revenant::Request::command("#eval x", -1));
  expect(r.ok && first_message(r.response) == "1", "healthy state restored on the respawned process");
  r = sup.run(revenant::Request::command("def y := 2"));
  expect(r.ok && r.warnings.empty(), "later runs are not affected");
  r = sup.restart();
  expect(r.ok && r.warnings.empty(), "next restart replays cleanly");
}

void test_supervisor_unpinned_parent_pin_refused() {
  revenant::Supervisor sup(fake_config());
  auto r = sup.run(revenant::Request::command("theorem t : 1 = 1 := sorry"));
  expect(r.ok && r.response.sorries.size() == 1, "sorry reported");
  const int64_t ps = *r.response.sorries[0].proof_state;
  revenant::RunOptions pin;
  pin.pin = true;
  r = sup.run(revenant::Request::proof_step("skip", ps), pin);
  expect(r.ok, "the step itself succeeds");
  expect(r.warnings.size() == 1 && r.warnings[0].code == revenant::ErrorCode::invalid_request,
         "pin on a raw parent refused with a warning");
  expect(r.response.proof_state && *r.response.proof_state >= 0, "response keeps the raw id");
  expect(sup.pinned_states().empty(), "nothing stored");
}

void test_supervisor_raw_parent_never_rebound() {
  revenant::Supervisor sup(fake_config());
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("def x := 1"), pin);
  expect(r.ok && r.response.env == -1, "first pin");
  r = sup.run(revenant::Request::command("def c := 100"));
  expect(r.ok && r.response.env && *r.response.env >= 0, "unpinned env");
  const int64_t raw = *r.response.env;
  r = sup.run(revenant::Request::command("def b := 2"), pin);
  expect(r.ok && r.response.env == -2, "second pin");

  // After a restart the replayed pins re-mint low ids, so `raw` could name
  // a different environment.
  r = sup.run(revenant::Request::command("def d := c", raw), pin);
  expect(r.ok && r.warnings.size() == 1 && r.warnings[0].code == revenant::ErrorCode::invalid_request,
         "pin on a raw parent refused");
  expect(r.response.env && *r.response.env >= 0, "raw id returned");
  const auto e = sup.run(revenant::Request::command("#eval d", *r.response.env));
  expect(e.ok && first_message(e.response) == "100", "state usable in this generation");

  r = sup.restart();
  expect(r.ok && r.warnings.empty(), "restart replays only the self-contained pins");
  const auto states = sup.pinned_states();
  expect(states.size() == 2 && states[0].session_id == -1 && states[1].session_id == -2, "pins unchanged");
  r = sup.run(revenant::Request::command("#eval b", -2));
  expect(r.ok && first_message(r.response) == "2", "pinned state intact");
}

void test_supervisor_pinned_chain() {
  revenant::Supervisor sup(fake_config());
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("def x := 1"), pin);
  expect(r.ok && r.response.env == -1, "first pin");
  r = sup.run(revenant::Request::command("def y := x + 1", -1), pin);
  expect(r.ok && r.response.env == -2, "second pin on pinned parent");
  r = sup.restart();
  expect(r.ok && r.warnings.empty(), "chain replays cleanly");
  r = sup.run(revenant::Request::command("#eval y + x", -2));
  expect(r.ok && first_message(r.response) == "3", "chain state restored");
}

void test_supervisor_pickle_strategy() {
  auto c = fake_config();
  c.cache_strategy = revenant::CacheStrategy::pickle;
  revenant::Supervisor sup(c);
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("def x := 5"), pin);
  expect(r.ok && r.response.env == -1 && r.warnings.empty(), "env pinned by pickle");
  r = sup.run(revenant::Request::command("theorem t : 2 = 2 := sorry"));
  const int64_t ps = *r.response.sorries[0].proof_state;
  r = sup.run(revenant::Request::proof_step("skip", ps), pin);
  expect(r.ok && r.response.proof_state == -2, "proof state pinned by pickle");

  const auto states = sup.pinned_states();
  expect(states.size() == 2 && states[0].strategy == revenant::CacheStrategy::pickle, "pickle entries");
  expect(fs::exists(sup.session_cache().pickle_path(states[0].key)), "pickle file written");

  r = sup.restart();
  expect(r.ok && r.warnings.empty(), "unpickle on restart");
  r = sup.run(revenant::Request::command("#eval x", -1));
  expect(r.ok && first_message(r.response) == "5", "pickled env restored");
  r = sup.run(revenant::Request::proof_step("rfl", -2));
  expect(r.ok && r.response.proof_status == "Completed", "pickled proof state restored");
}

void test_supervisor_deferred_memory_restart() {
  auto rss = std::make_shared<std::atomic<uint64_t>>(100);
  auto probe = [rss](pid_t) {
    revenant::MemoryReading m;
    m.valid = true;
    m.process_rss_bytes = rss->load();
    m.system_total_bytes = 1000;
    m.system_available_bytes = 1000;
    return m;
  };
  auto c = fake_config();
  c.max_process_memory = 0.5;
  revenant::Supervisor sup(c, nullptr, probe);
  auto r = sup.run(revenant::Request::command("def a := 1"));
  expect(r.ok && r.generation == 1, "healthy");
  rss->store(900);
  r = sup.run(revenant::Request::command("def b := 2"));
  expect(r.ok && r.response.env.has_value(), "response delivered despite breach");
  expect(sup.state() == revenant::SupervisorState::degraded, "restart deferred");
  expect(sup.stats().memory_breaches.load() == 1, "breach counted");
  rss->store(100);
  r = sup.run(revenant::Request::command("def c := 3"));
  expect(r.ok && r.generation == 2, "restarted before next dispatch");
}

void test_supervisor_memory_limit_exceeded() {
  auto probe = [](pid_t) {
    revenant::MemoryReading m;
    m.valid = true;
    m.process_rss_bytes = 900;
    m.system_total_bytes = 1000;
    m.system_available_bytes = 1000;
    return m;
  };
  auto c = fake_config();
  c.max_process_memory = 0.5;
  revenant::Supervisor sup(c, nullptr, probe);
  const auto r = sup.run(revenant::Request::command("def a := 1"));
  expect(!r.ok && r.error == revenant::ErrorCode::memory_limit_exceeded, "persistent breach");
  expect(sup.state() == revenant::SupervisorState::stopped, "supervisor stopped");
}

void test_supervisor_concurrent_callers() {
  revenant::Supervisor sup(fake_config());
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      const std::string name = "t" + std::to_string(t);
      auto r = sup.run(revenant::Request::command("def " + name + " := " + std::to_string(t)));
      if (!r.ok || !r.response.env) {
        failures++;
        return;
      }
      auto e = sup.run(revenant::Request::command("#eval " + name, *r.response.env));
      if (!e.ok || first_message(e.response) != std::to_string(t)) failures++;
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "every caller sees its own state");
  expect(sup.stats().requests.load() == 16, "all requests counted");
  expect(sup.generation() == 1, "single process served everyone");
}

void test_supervisor_isolation() {
  revenant::Supervisor a(fake_config());
  revenant::Supervisor b(fake_config());
  revenant::RunOptions pin;
  pin.pin = true;
  auto ra = a.run(revenant::Request::command("def x := 1"), pin);
  auto rb = b.run(revenant::Request::command("def y := 1"));
  expect(ra.ok && rb.ok, "both run");
  expect(b.pinned_states().empty(), "private caches are disjoint");
  auto plain = a.run(revenant::Request::command("def z := 1"));
  const auto cross = b.run(revenant::Request::command("#eval 1", *plain.response.env));
  expect(cross.error == revenant::ErrorCode::unknown_parent, "ids from another supervisor rejected");
  const auto cross_session = b.run(revenant::Request::command("#eval x", -1));
  expect(cross_session.error == revenant::ErrorCode::unknown_session, "sessions do not leak");
}

void test_supervisor_shared_cache_dir() {
  TempDir dir;
  auto c = fake_config();
  c.cache_dir = dir.path.string();
  revenant::RunOptions pin;
  pin.pin = true;
  {
    revenant::Supervisor first(c);
    const auto r = first.run(revenant::Request::command("def x := 40"), pin);
    expect(r.ok && r.response.env == -1, "pinned into shared cache");
  }
  revenant::Supervisor second(c);
  const auto r = second.run(revenant::Request::command("#eval x + 2", -1));
  expect(r.ok && first_message(r.response) == "42", "state restored in a new supervisor: " + r.detail);
}

void test_supervisor_kill_and_unpin() {
  revenant::Supervisor sup(fake_config());
  revenant::RunOptions pin;
  pin.pin = true;
  auto r = sup.run(revenant::Request::command("def x := 1"), pin);
  expect(r.ok, "pinned");
  sup.kill();
  expect(!sup.is_alive() && sup.state() == revenant::SupervisorState::stopped, "killed");
  r = sup.run(revenant::Request::command("#eval x", -1));
  expect(r.ok && r.generation == 2 && first_message(r.response) == "1", "lazy restart after kill");
  expect(sup.unpin(-1), "unpin");
  expect(!sup.unpin(-1), "second unpin is a no-op");
  r = sup.run(revenant::Request::command("#eval x", -1));
  expect(r.error == revenant::ErrorCode::unknown_session, "unpinned session gone");
}

void test_supervisor_retention() {
  auto c = fake_config();
  c.cache_retention.max_entries = 1;
  revenant::Supervisor sup(c);
  revenant::RunOptions pin;
  pin.pin = true;
  (void)sup.run(revenant::Request::command("def a := 1"), pin);
  (void)sup.run(revenant::Request::command("def b := 2"), pin);
  const auto states = sup.pinned_states();
  expect(states.size() == 1 && states[0].session_id == -2, "oldest pin evicted");
  expect(sup.run(revenant::Request::command("#eval 1", -1)).error == revenant::ErrorCode::unknown_session,
         "evicted session unknown");
  expect(sup.clear_session_cache() == 1, "clear_session_cache");
}

void test_supervisor_default_options_in_digest() {
  auto c = fake_config();
  revenant::Supervisor plain(c);
  c.enable_parallel_elaboration = false;
  revenant::Supervisor tuned(c);
  const auto a = plain.run(revenant::Request::command("def x := 1"));
  const auto b = tuned.run(revenant::Request::command("def x := 1"));
  expect(a.ok && b.ok, "both run");
  expect(a.request_digest != b.request_digest, "merged options change the request identity");
}

void test_supervisor_cross_process_use() {
  revenant::Supervisor sup(fake_config());
  expect(sup.run(revenant::Request::command("def x := 1")).ok, "parent runs");
  const pid_t child = ::fork();
  if (child == 0) {
    const auto r = sup.run(revenant::Request::command("def y := 1"));
    ::_exit(r.error == revenant::ErrorCode::cross_process_use ? 0 : 1);
  }
  int status = 0;
  ::waitpid(child, &status, 0);
  expect(WIFEXITED(status) && WEXITSTATUS(status) == 0, "child refused");
  expect(sup.run(revenant::Request::command("#eval 2", 0)).ok, "parent unaffected");
}

std::mutex g_events_mu;
std::vector<revenant::SupervisorEvent> g_events;

void collect_event(const revenant::SupervisorEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

void test_supervisor_events_and_stats() {
  TempDir dir;
  revenant::set_supervisor_event_hook(&collect_event);
  {
    revenant::Supervisor sup(fake_config());
    (void)sup.run(revenant::Request::command("#crash_once " + dir.file("marker")));
    const std::string stats = sup.stats().to_json();
    expect(stats.find("\"restarts\":1") != std::string::npos, "stats JSON: " + stats);
  }
  revenant::set_supervisor_event_hook(nullptr);

  int spawns = 0, failed_dispatches = 0, restarts = 0;
  for (const auto& ev : g_events) {
    if (ev.kind == revenant::EventKind::spawn && ev.ok) spawns++;
    if (ev.kind == revenant::EventKind::dispatch && !ev.ok) failed_dispatches++;
    if (ev.kind == revenant::EventKind::restart && ev.ok) restarts++;
  }
  expect(spawns == 2 && restarts == 2, "two generations spawned");
  expect(failed_dispatches == 1, "one failed dispatch");
  expect(g_events.front().to_json().find("\"event\":\"spawn\"") != std::string::npos, "event JSON");
}

}  // namespace

int main() {
  std::cout << "=== Revenant Supervisor Test Suite ===\n";

  std::cout << "\n[Phase 1] JSON and Hashing\n";
  run_test("JSON parse and canonicalize", test_json_parse_and_canonicalize);
  run_test("JSON rejects malformed input", test_json_rejects_malformed);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 2] Wire Protocol\n";
  run_test("encode command request", test_encode_command_request);
  run_test("decode request shapes", test_decode_request_shapes);
  run_test("decode command response", test_decode_command_response);
  run_test("decode LeanError", test_decode_lean_error);
  run_test("flag-gated fields", test_flag_gated_fields);
  run_test("root goals fallback", test_root_goals_fallback);
  run_test("malformed responses", test_decode_malformed_response);
  run_test("proof step response kind", test_proof_step_response_kind);
  run_test("frame assembler", test_frame_assembler);
  run_test("frame assembler chunked unit", test_frame_assembler_chunked_unit);

  std::cout << "\n[Phase 3] Options and Configuration\n";
  run_test("option keys and overlay", test_option_keys);
  run_test("effective default options", test_effective_default_options);
  run_test("config from environment", test_config_from_env);
  run_test("config from JSON", test_config_json);
  run_test("config validation", test_config_validation);

  std::cout << "\n[Phase 4] Request Serializer\n";
  run_test("mutual exclusion (8 threads)", test_serializer_mutual_exclusion);
  run_test("guard release and move", test_serializer_guard_release);
  run_test("forked child refused", test_serializer_cross_process);

  std::cout << "\n[Phase 5] Resource Monitor\n";
  run_test("fake probe breaches", test_monitor_fake_probe);
  run_test("uptime limit", test_monitor_uptime);
  run_test("/proc readings", test_monitor_reads_proc);

  std::cout << "\n[Phase 6] Session Cache\n";
  run_test("put/get/list", test_cache_put_get_list);
  run_test("persistence and id allocation", test_cache_persistence);
  run_test("corruption detection", test_cache_corruption_detection);
  run_test("eviction", test_cache_eviction);
  run_test("concurrent writer processes", test_cache_concurrent_writers);
  run_test("index tracks on-disk changes", test_cache_index_tracks_changes);

  std::cout << "\n[Phase 7] Process and Transport\n";
  run_test("spawn failure", test_spawn_failure_reported);
  run_test("round trip (compact and pretty)", test_transport_roundtrip);
  run_test("timeout taints transport", test_transport_timeout_taints);
  run_test("crash detection", test_transport_crash);
  run_test("garbage output", test_transport_garbage);
  run_test("stderr tail", test_transport_stderr_tail);

  std::cout << "\n[Phase 8] Supervisor\n";
  run_test("basic dispatch", test_supervisor_basic_dispatch);
  run_test("LeanError is ok", test_supervisor_lean_error_is_ok);
  run_test("validation errors", test_supervisor_validation_errors);
  run_test("pin survives crash", test_supervisor_pin_survives_crash);
  run_test("recovers from single crash", test_supervisor_recovers_from_single_crash);
  run_test("always crashing prover", test_supervisor_always_crash);
  run_test("spawn failure", test_supervisor_spawn_failure);
  run_test("timeout then restart", test_supervisor_timeout_then_restart);
  run_test("retry on timeout", test_supervisor_retry_on_timeout);
  run_test("protocol error", test_supervisor_protocol_error);
  run_test("replay failure warning", test_supervisor_replay_failure_warning);
  run_test("replay that kills the process", test_supervisor_replay_crash_discards_state);
  run_test("pin on unpinned parent refused", test_supervisor_unpinned_parent_pin_refused);
  run_test("raw parent never rebound", test_supervisor_raw_parent_never_rebound);
  run_test("pinned chain", test_supervisor_pinned_chain);
  run_test("pickle strategy", test_supervisor_pickle_strategy);
  run_test("deferred memory restart", test_supervisor_deferred_memory_restart);
  run_test("memory limit exceeded", test_supervisor_memory_limit_exceeded);
  run_test("concurrent callers (8 threads)", test_supervisor_concurrent_callers);
  run_test("supervisor isolation", test_supervisor_isolation);
  run_test("shared cache directory", test_supervisor_shared_cache_dir);
  run_test("kill and unpin", test_supervisor_kill_and_unpin);
  run_test("cache retention", test_supervisor_retention);
  run_test("default options in digest", test_supervisor_default_options_in_digest);
  run_test("cross-process use", test_supervisor_cross_process_use);
  run_test("events and stats", test_supervisor_events_and_stats);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
