#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rdg {

// Minimum-interval gate keyed by relay credential. Calls for one key are
// serialised and spaced at least `interval` apart; distinct keys never wait
// on each other.
class RateLimiter {
public:
  using Clock   = std::chrono::steady_clock;
  using NowFn   = std::function<Clock::time_point()>;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  explicit RateLimiter(std::chrono::milliseconds interval);
  RateLimiter(std::chrono::milliseconds interval, NowFn now, SleepFn sleep);

  // Blocks until `key` may issue its next call and records the call.
  // Returns how long the caller was held back.
  std::chrono::milliseconds acquire(const std::string& key);

  std::chrono::milliseconds interval() const { return interval_; }

private:
  struct Slot {
    std::mutex mu;
    bool used = false;
    Clock::time_point last;
  };

  Slot& slotFor(const std::string& key);

  std::chrono::milliseconds interval_;
  NowFn now_;
  SleepFn sleep_;
  std::mutex mapMu_;
  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace rdg
