#pragma once

// revenant/config.hpp — Supervisor configuration.
//
// SupervisorConfig is an explicit value handed to each Supervisor at
// construction. There is no process-wide default instance; embedders that need
// one hold it themselves.
//
// Sources, lowest precedence first:
//   1. struct defaults
//   2. parse_config_json(text, base)
//   3. SupervisorConfig::from_env(base)  (REVENANT_* variables)

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "revenant/session_cache.hpp"
#include "revenant/types.hpp"

namespace revenant {

struct SupervisorConfig {
  // --- prover process ---
  std::string command{"lake"};
  std::vector<std::string> argv{"exe", "repl"};
  std::string cwd;
  std::map<std::string, std::string> env;

  // --- timing ---
  std::chrono::milliseconds request_timeout{60000};
  std::chrono::milliseconds replay_timeout{60000};
  std::chrono::milliseconds terminate_grace{2000};

  // --- recovery ---
  uint32_t max_attempts{3};
  bool retry_on_timeout{false};

  // --- resources ---
  double max_process_memory{0.8};
  double max_system_memory{0.8};
  uint64_t memory_hard_limit_mb{0};
  std::chrono::milliseconds max_uptime{0};

  // --- elaboration ---
  bool enable_incremental_optimization{true};
  bool enable_parallel_elaboration{true};
  OptionMap default_options;

  // --- session cache ---
  // Empty: a private temporary directory owned by the Supervisor.
  std::string cache_dir;
  CacheStrategy cache_strategy{CacheStrategy::replay};
  std::string cache_compression{"off"};
  CacheRetention cache_retention;

  // --- behaviour ---
  bool strict_id_tracking{true};
  bool verbose{false};

  // Default options with the elaboration switches applied.
  OptionMap effective_default_options() const;

  // Overlay REVENANT_* environment variables on top of `base`.
  static SupervisorConfig from_env(const SupervisorConfig& base);
  static SupervisorConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const SupervisorConfig& config);

// Overlay a JSON document on top of `base`. Unknown keys and ill-typed values
// are listed in *error (empty when clean); ill-typed fields keep `base`.
SupervisorConfig parse_config_json(const std::string& text, const SupervisorConfig& base, std::string* error);

std::string config_to_json(const SupervisorConfig& config);

}  // namespace revenant
