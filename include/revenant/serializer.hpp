#pragma once

// revenant/serializer.hpp — Per-Supervisor request gate.
//
// A ticket lock: waiters are admitted strictly in arrival order, so at most
// one request is in flight per process and no caller starves. The gate is
// bound to the OS process that created it; use from a forked child is
// refused with cross_process_use.

#include <sys/types.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace revenant {

class RequestSerializer {
 public:
  class Guard {
   public:
    Guard() = default;
    ~Guard() { release(); }
    Guard(Guard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
    Guard& operator=(Guard&& other) noexcept;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    bool held() const { return owner_ != nullptr; }
    void release();

   private:
    friend class RequestSerializer;
    explicit Guard(RequestSerializer* owner) : owner_(owner) {}
    RequestSerializer* owner_{nullptr};
  };

  RequestSerializer();

  // Blocks until this caller's turn. Returns an empty guard when called from
  // a process other than the owner.
  Guard acquire();

  pid_t owner_pid() const { return owner_pid_; }
  uint64_t contended() const { return contended_.load(std::memory_order_relaxed); }
  uint64_t admitted() const { return admitted_.load(std::memory_order_relaxed); }

 private:
  void release_ticket();

  std::mutex mu_;
  std::condition_variable cv_;
  uint64_t next_ticket_{0};
  uint64_t now_serving_{0};
  pid_t owner_pid_;
  std::atomic<uint64_t> contended_{0};
  std::atomic<uint64_t> admitted_{0};
};

}  // namespace revenant
