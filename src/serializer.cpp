#include "revenant/serializer.hpp"

#include <unistd.h>

namespace revenant {

RequestSerializer::RequestSerializer() : owner_pid_(getpid()) {}

RequestSerializer::Guard& RequestSerializer::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

void RequestSerializer::Guard::release() {
  if (owner_) {
    owner_->release_ticket();
    owner_ = nullptr;
  }
}

RequestSerializer::Guard RequestSerializer::acquire() {
  if (getpid() != owner_pid_) return Guard{};

  std::unique_lock<std::mutex> lk(mu_);
  const uint64_t ticket = next_ticket_++;
  if (ticket != now_serving_) {
    contended_.fetch_add(1, std::memory_order_relaxed);
    cv_.wait(lk, [&] { return now_serving_ == ticket; });
  }
  admitted_.fetch_add(1, std::memory_order_relaxed);
  return Guard{this};
}

void RequestSerializer::release_ticket() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++now_serving_;
  }
  cv_.notify_all();
}

}  // namespace revenant
