#pragma once

// revenant/resource_monitor.hpp — Memory and uptime sampling.
//
// sample() is a pure read and safe to call concurrently. The Supervisor only
// consults it between requests; a breach defers the restart to the next
// dispatch instead of interrupting the current one.

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace revenant {

struct MemoryReading {
  bool valid{false};
  uint64_t process_rss_bytes{0};
  uint64_t system_total_bytes{0};
  uint64_t system_available_bytes{0};
};

struct ResourceSample {
  bool valid{false};
  double process_memory_fraction{0.0};
  double system_memory_fraction{0.0};
  std::chrono::milliseconds elapsed_since_start{0};
  uint64_t process_rss_bytes{0};
  uint64_t system_total_bytes{0};
  uint64_t system_available_bytes{0};
};

struct ResourceLimits {
  double max_process_memory{0.8};  // of the hard ceiling, else of system total
  double max_system_memory{0.8};   // used / total
  uint64_t process_limit_bytes{0}; // 0 = measure against system total
  std::chrono::milliseconds max_uptime{0};  // 0 = unbounded
};

enum class BreachKind {
  process_memory,
  system_memory,
  uptime,
};

std::string to_string(BreachKind kind);

struct ResourceBreach {
  BreachKind kind{BreachKind::process_memory};
  double observed{0.0};
  double limit{0.0};
  std::string describe() const;
};

class ResourceMonitor {
 public:
  // Reads memory for the process group led by `pid`.
  using Probe = std::function<MemoryReading(pid_t pid)>;

  explicit ResourceMonitor(ResourceLimits limits, Probe probe = {});

  ResourceSample sample(pid_t pid, std::chrono::steady_clock::time_point started_at) const;
  std::optional<ResourceBreach> check(const ResourceSample& sample) const;

  const ResourceLimits& limits() const { return limits_; }

  // /proc based probe: RSS summed over the process group, /proc/meminfo.
  static MemoryReading read_proc(pid_t pid);

 private:
  ResourceLimits limits_;
  Probe probe_;
};

}  // namespace revenant
