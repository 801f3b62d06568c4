#include "revenant/config.hpp"

#include <cstdlib>
#include <sstream>

#include "revenant/jsonlite.hpp"
#include "revenant/protocol.hpp"

namespace revenant {

namespace {

const char* env_value(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? e : nullptr;
}

bool env_flag(const char* e) {
  const std::string v(e);
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::vector<std::string> split_words(const std::string& s) {
  std::istringstream in(s);
  std::vector<std::string> out;
  std::string w;
  while (in >> w) out.push_back(w);
  return out;
}

const std::vector<std::string> kKnownKeys = {
    "command", "argv", "cwd", "env",
    "request_timeout_ms", "replay_timeout_ms", "terminate_grace_ms",
    "max_attempts", "retry_on_timeout",
    "max_process_memory", "max_system_memory", "memory_hard_limit_mb", "max_uptime_ms",
    "enable_incremental_optimization", "enable_parallel_elaboration", "default_options",
    "cache_dir", "cache_strategy", "cache_compression", "cache_max_entries", "cache_max_age_s",
    "strict_id_tracking", "verbose",
};

}  // namespace

OptionMap SupervisorConfig::effective_default_options() const {
  OptionMap out = default_options;
  if (!enable_parallel_elaboration) out[OptionKey::parse("Elab.async")] = OptionValue{false};
  if (!enable_incremental_optimization) out[OptionKey::parse("Elab.incremental")] = OptionValue{false};
  return out;
}

SupervisorConfig SupervisorConfig::from_env() { return from_env(SupervisorConfig{}); }

SupervisorConfig SupervisorConfig::from_env(const SupervisorConfig& base) {
  SupervisorConfig c = base;
  if (const char* e = env_value("REVENANT_REPL_COMMAND")) {
    auto words = split_words(e);
    if (!words.empty()) {
      c.command = words.front();
      c.argv.assign(words.begin() + 1, words.end());
    }
  }
  if (const char* e = env_value("REVENANT_REPL_CWD")) c.cwd = e;
  if (const char* e = env_value("REVENANT_TIMEOUT_MS")) {
    c.request_timeout = std::chrono::milliseconds(std::strtoull(e, nullptr, 10));
  }
  if (const char* e = env_value("REVENANT_REPLAY_TIMEOUT_MS")) {
    c.replay_timeout = std::chrono::milliseconds(std::strtoull(e, nullptr, 10));
  }
  if (const char* e = env_value("REVENANT_MAX_ATTEMPTS")) {
    c.max_attempts = static_cast<uint32_t>(std::strtoul(e, nullptr, 10));
  }
  if (const char* e = env_value("REVENANT_MEMORY_HARD_LIMIT_MB")) {
    c.memory_hard_limit_mb = std::strtoull(e, nullptr, 10);
  }
  if (const char* e = env_value("REVENANT_MAX_PROCESS_MEMORY")) c.max_process_memory = std::strtod(e, nullptr);
  if (const char* e = env_value("REVENANT_MAX_SYSTEM_MEMORY")) c.max_system_memory = std::strtod(e, nullptr);
  if (const char* e = env_value("REVENANT_CACHE_DIR")) c.cache_dir = e;
  if (const char* e = env_value("REVENANT_CACHE_STRATEGY")) {
    if (auto s = parse_cache_strategy(e)) c.cache_strategy = *s;
  }
  if (const char* e = env_value("REVENANT_CACHE_COMPRESSION")) c.cache_compression = e;
  if (const char* e = env_value("REVENANT_VERBOSE")) c.verbose = env_flag(e);
  return c;
}

ConfigValidationResult validate_config(const SupervisorConfig& config) {
  ConfigValidationResult r;
  if (config.command.empty()) r.errors.push_back("command must not be empty");
  if (config.max_attempts < 1) r.errors.push_back("max_attempts must be >= 1");
  if (config.request_timeout.count() <= 0) r.errors.push_back("request_timeout must be positive");
  if (config.replay_timeout.count() <= 0) r.errors.push_back("replay_timeout must be positive");
  if (config.terminate_grace.count() < 0) r.errors.push_back("terminate_grace must not be negative");
  if (config.max_process_memory < 0.0 || config.max_process_memory > 1.0) {
    r.errors.push_back("max_process_memory must be within [0, 1]");
  }
  if (config.max_system_memory < 0.0 || config.max_system_memory > 1.0) {
    r.errors.push_back("max_system_memory must be within [0, 1]");
  }
  if (config.cache_compression != "off" && config.cache_compression != "zstd") {
    r.errors.push_back("cache_compression must be off or zstd");
  }
  for (const auto& bad : invalid_option_keys(config.default_options)) {
    r.errors.push_back("invalid default option key: " + bad);
  }
  if (config.max_process_memory == 0.0 && config.max_system_memory == 0.0) {
    r.warnings.push_back("memory monitoring disabled");
  }
#if !defined(REVENANT_WITH_ZSTD)
  if (config.cache_compression == "zstd") {
    r.warnings.push_back("built without zstd; cache entries are stored uncompressed");
  }
#endif
  if (config.retry_on_timeout && config.max_attempts > 1) {
    r.warnings.push_back("retry_on_timeout re-sends requests that may never terminate");
  }
  r.ok = r.errors.empty();
  return r;
}

SupervisorConfig parse_config_json(const std::string& text, const SupervisorConfig& base, std::string* error) {
  SupervisorConfig c = base;
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(text, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return c;
  }
  std::string problems;
  auto note = [&](const std::string& p) {
    if (!problems.empty()) problems += "; ";
    problems += p;
  };
  for (const auto& [k, v] : o) {
    (void)v;
    bool known = false;
    for (const auto& kk : kKnownKeys) known = known || kk == k;
    if (!known) note("unknown key: " + k);
  }

  c.command = jsonlite::get_string(o, "command", c.command);
  if (o.contains("argv")) c.argv = jsonlite::get_string_array(o, "argv");
  c.cwd = jsonlite::get_string(o, "cwd", c.cwd);
  for (const auto& [k, v] : jsonlite::get_string_map(o, "env")) c.env[k] = v;

  auto ms = [&](const char* key, std::chrono::milliseconds& out) {
    if (!o.contains(key)) return;
    auto n = jsonlite::get_i64(o, key);
    if (!n || *n < 0) { note(std::string(key) + " must be a non-negative integer"); return; }
    out = std::chrono::milliseconds(*n);
  };
  ms("request_timeout_ms", c.request_timeout);
  ms("replay_timeout_ms", c.replay_timeout);
  ms("terminate_grace_ms", c.terminate_grace);
  ms("max_uptime_ms", c.max_uptime);

  c.max_attempts = static_cast<uint32_t>(jsonlite::get_u64(o, "max_attempts", c.max_attempts));
  c.retry_on_timeout = jsonlite::get_bool(o, "retry_on_timeout", c.retry_on_timeout);
  c.max_process_memory = jsonlite::get_double(o, "max_process_memory", c.max_process_memory);
  c.max_system_memory = jsonlite::get_double(o, "max_system_memory", c.max_system_memory);
  c.memory_hard_limit_mb = jsonlite::get_u64(o, "memory_hard_limit_mb", c.memory_hard_limit_mb);
  c.enable_incremental_optimization =
      jsonlite::get_bool(o, "enable_incremental_optimization", c.enable_incremental_optimization);
  c.enable_parallel_elaboration = jsonlite::get_bool(o, "enable_parallel_elaboration", c.enable_parallel_elaboration);

  if (const auto* opts = jsonlite::get_object(o, "default_options")) {
    // Reuse the wire decoder for option values.
    jsonlite::Object wrapper;
    wrapper["cmd"] = jsonlite::Value{std::string()};
    wrapper["options"] = jsonlite::Value{*opts};
    std::string derr;
    if (auto req = decode_request(jsonlite::serialize(wrapper), &derr)) {
      for (const auto& [k, v] : req->options) c.default_options[k] = v;
    } else {
      note("default_options: " + derr);
    }
  }

  c.cache_dir = jsonlite::get_string(o, "cache_dir", c.cache_dir);
  if (o.contains("cache_strategy")) {
    if (auto s = parse_cache_strategy(jsonlite::get_string(o, "cache_strategy", ""))) c.cache_strategy = *s;
    else note("cache_strategy must be replay or pickle");
  }
  c.cache_compression = jsonlite::get_string(o, "cache_compression", c.cache_compression);
  c.cache_retention.max_entries =
      static_cast<std::size_t>(jsonlite::get_u64(o, "cache_max_entries", c.cache_retention.max_entries));
  c.cache_retention.max_age = std::chrono::seconds(
      jsonlite::get_u64(o, "cache_max_age_s", static_cast<unsigned long long>(c.cache_retention.max_age.count())));
  c.strict_id_tracking = jsonlite::get_bool(o, "strict_id_tracking", c.strict_id_tracking);
  c.verbose = jsonlite::get_bool(o, "verbose", c.verbose);

  if (error) *error = problems;
  return c;
}

std::string config_to_json(const SupervisorConfig& c) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["command"] = Value{c.command};
  jsonlite::Array argv;
  for (const auto& a : c.argv) argv.push_back(Value{a});
  o["argv"] = Value{std::move(argv)};
  o["cwd"] = Value{c.cwd};
  jsonlite::Object env;
  for (const auto& [k, v] : c.env) env[k] = Value{v};
  o["env"] = Value{std::move(env)};
  o["request_timeout_ms"] = Value{static_cast<std::uint64_t>(c.request_timeout.count())};
  o["replay_timeout_ms"] = Value{static_cast<std::uint64_t>(c.replay_timeout.count())};
  o["terminate_grace_ms"] = Value{static_cast<std::uint64_t>(c.terminate_grace.count())};
  o["max_uptime_ms"] = Value{static_cast<std::uint64_t>(c.max_uptime.count())};
  o["max_attempts"] = Value{static_cast<std::uint64_t>(c.max_attempts)};
  o["retry_on_timeout"] = Value{c.retry_on_timeout};
  o["max_process_memory"] = Value{c.max_process_memory};
  o["max_system_memory"] = Value{c.max_system_memory};
  o["memory_hard_limit_mb"] = Value{static_cast<std::uint64_t>(c.memory_hard_limit_mb)};
  o["enable_incremental_optimization"] = Value{c.enable_incremental_optimization};
  o["enable_parallel_elaboration"] = Value{c.enable_parallel_elaboration};
  o["cache_dir"] = Value{c.cache_dir};
  o["cache_strategy"] = Value{to_string(c.cache_strategy)};
  o["cache_compression"] = Value{c.cache_compression};
  o["cache_max_entries"] = Value{static_cast<std::uint64_t>(c.cache_retention.max_entries)};
  o["cache_max_age_s"] = Value{static_cast<std::uint64_t>(c.cache_retention.max_age.count())};
  o["strict_id_tracking"] = Value{c.strict_id_tracking};
  o["verbose"] = Value{c.verbose};
  if (!c.default_options.empty()) {
    Request probe;
    probe.options = c.default_options;
    o["default_options"] = request_to_object(probe)["options"];
  }
  return jsonlite::serialize(o);
}

}  // namespace revenant
