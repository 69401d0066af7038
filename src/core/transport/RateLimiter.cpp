#include "RateLimiter.hpp"

#include <thread>

namespace rdg {

RateLimiter::RateLimiter(std::chrono::milliseconds interval)
  : RateLimiter(interval,
                [] { return Clock::now(); },
                [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

RateLimiter::RateLimiter(std::chrono::milliseconds interval, NowFn now, SleepFn sleep)
  : interval_(interval), now_(std::move(now)), sleep_(std::move(sleep)) {}

RateLimiter::Slot& RateLimiter::slotFor(const std::string& key) {
  std::lock_guard<std::mutex> lock(mapMu_);
  auto& slot = slots_[key];
  if (!slot) slot = std::make_unique<Slot>();
  return *slot;
}

std::chrono::milliseconds RateLimiter::acquire(const std::string& key) {
  Slot& slot = slotFor(key);
  // Held across the sleep so that waiters on the same key queue up.
  std::lock_guard<std::mutex> lock(slot.mu);

  std::chrono::milliseconds waited{0};
  if (slot.used) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - slot.last);
    if (elapsed < interval_) {
      waited = interval_ - elapsed;
      sleep_(waited);
    }
  }
  slot.used = true;
  slot.last = now_();
  return waited;
}

} // namespace rdg
