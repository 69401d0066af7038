#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "BackendPool.hpp"

namespace rdg {

// Re-checks every active backend on a fixed interval.
class HealthMonitor {
public:
  HealthMonitor(BackendPool& pool, std::chrono::seconds interval);
  ~HealthMonitor();

  void start();
  void stop();

private:
  void worker_loop();

  BackendPool& pool_;
  std::chrono::seconds interval_;

  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace rdg
