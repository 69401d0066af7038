#include "HealthMonitor.hpp"

#include <spdlog/spdlog.h>

namespace rdg {

HealthMonitor::HealthMonitor(BackendPool& pool, std::chrono::seconds interval)
  : pool_(pool), interval_(interval) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start() {
  if (running_.exchange(true)) return;
  worker_thread_ = std::thread([this] { worker_loop(); });
  spdlog::info("health monitor probing every {}s", interval_.count());
}

void HealthMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
}

void HealthMonitor::worker_loop() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
    if (!running_) break;
    try {
      size_t healthy = pool_.checkAll();
      spdlog::debug("health sweep: {} healthy backends", healthy);
    } catch (const std::exception& e) {
      spdlog::error("health sweep failed: {}", e.what());
    }
  }
}

} // namespace rdg
