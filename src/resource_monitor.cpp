#include "revenant/resource_monitor.hpp"

#include <unistd.h>

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace revenant {

namespace {

// Returns false when the stat line cannot be parsed.
bool read_stat(const fs::path& stat_path, pid_t& pgrp, uint64_t& rss_pages) {
  std::ifstream in(stat_path);
  if (!in) return false;
  std::string line;
  std::getline(in, line);
  // comm may contain spaces and parentheses; fields resume after the last ')'.
  const auto close = line.rfind(')');
  if (close == std::string::npos || close + 2 > line.size()) return false;
  std::istringstream rest(line.substr(close + 2));
  std::vector<std::string> fields;
  std::string f;
  while (rest >> f) fields.push_back(f);
  // fields[0] is field 3 (state): pgrp is field 5, rss is field 24.
  if (fields.size() < 22) return false;
  try {
    pgrp = static_cast<pid_t>(std::stol(fields[2]));
    rss_pages = std::stoull(fields[21]);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

bool read_meminfo(uint64_t& total, uint64_t& available) {
  std::ifstream in("/proc/meminfo");
  if (!in) return false;
  std::string key;
  uint64_t value = 0;
  std::string unit;
  bool have_total = false;
  bool have_avail = false;
  while (in >> key >> value) {
    std::getline(in, unit);
    if (key == "MemTotal:") { total = value * 1024u; have_total = true; }
    else if (key == "MemAvailable:") { available = value * 1024u; have_avail = true; }
    if (have_total && have_avail) break;
  }
  return have_total && have_avail;
}

}  // namespace

std::string to_string(BreachKind kind) {
  switch (kind) {
    case BreachKind::process_memory: return "process_memory";
    case BreachKind::system_memory: return "system_memory";
    case BreachKind::uptime: return "uptime";
  }
  return "";
}

std::string ResourceBreach::describe() const {
  char buf[128];
  if (kind == BreachKind::uptime) {
    std::snprintf(buf, sizeof(buf), "uptime %.0f ms exceeds %.0f ms", observed, limit);
  } else {
    std::snprintf(buf, sizeof(buf), "%s at %.3f exceeds %.3f", to_string(kind).c_str(), observed, limit);
  }
  return buf;
}

MemoryReading ResourceMonitor::read_proc(pid_t pid) {
  MemoryReading r;
  if (!read_meminfo(r.system_total_bytes, r.system_available_bytes)) return r;

  const long page = sysconf(_SC_PAGESIZE);
  const uint64_t page_bytes = page > 0 ? static_cast<uint64_t>(page) : 4096u;

  uint64_t rss_pages = 0;
  bool found_leader = false;
  std::error_code ec;
  for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;
    pid_t pgrp = 0;
    uint64_t pages = 0;
    if (!read_stat(it->path() / "stat", pgrp, pages)) continue;
    if (pgrp != pid) continue;
    rss_pages += pages;
    if (name == std::to_string(pid)) found_leader = true;
  }
  if (!found_leader) return r;
  r.process_rss_bytes = rss_pages * page_bytes;
  r.valid = true;
  return r;
}

ResourceMonitor::ResourceMonitor(ResourceLimits limits, Probe probe)
    : limits_(limits), probe_(probe ? std::move(probe) : Probe(&ResourceMonitor::read_proc)) {}

ResourceSample ResourceMonitor::sample(pid_t pid, std::chrono::steady_clock::time_point started_at) const {
  ResourceSample s;
  s.elapsed_since_start = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at);
  if (pid <= 0) return s;

  const MemoryReading m = probe_(pid);
  if (!m.valid || m.system_total_bytes == 0) return s;

  s.valid = true;
  s.process_rss_bytes = m.process_rss_bytes;
  s.system_total_bytes = m.system_total_bytes;
  s.system_available_bytes = m.system_available_bytes;
  const double denom = limits_.process_limit_bytes > 0
                           ? static_cast<double>(limits_.process_limit_bytes)
                           : static_cast<double>(m.system_total_bytes);
  s.process_memory_fraction = static_cast<double>(m.process_rss_bytes) / denom;
  const uint64_t used = m.system_total_bytes > m.system_available_bytes
                            ? m.system_total_bytes - m.system_available_bytes
                            : 0;
  s.system_memory_fraction = static_cast<double>(used) / static_cast<double>(m.system_total_bytes);
  return s;
}

std::optional<ResourceBreach> ResourceMonitor::check(const ResourceSample& sample) const {
  if (limits_.max_uptime.count() > 0 && sample.elapsed_since_start >= limits_.max_uptime) {
    return ResourceBreach{BreachKind::uptime, static_cast<double>(sample.elapsed_since_start.count()),
                          static_cast<double>(limits_.max_uptime.count())};
  }
  if (!sample.valid) return std::nullopt;
  if (limits_.max_process_memory > 0.0 && sample.process_memory_fraction >= limits_.max_process_memory) {
    return ResourceBreach{BreachKind::process_memory, sample.process_memory_fraction, limits_.max_process_memory};
  }
  if (limits_.max_system_memory > 0.0 && sample.system_memory_fraction >= limits_.max_system_memory) {
    return ResourceBreach{BreachKind::system_memory, sample.system_memory_fraction, limits_.max_system_memory};
  }
  return std::nullopt;
}

}  // namespace revenant
