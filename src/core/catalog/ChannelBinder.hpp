#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "core/metadata/MetadataStore.hpp"
#include "core/transport/RelayTransport.hpp"

namespace rdg {

struct InboundEvent {
  std::string backend_id;
  std::string body;        // raw relay update JSON
};

// Binds a backend to the channel it was just added to, from relay webhook
// updates processed off the request path.
class ChannelBinder {
public:
  ChannelBinder(MetadataStore& store, RelayTransport& transport);
  ~ChannelBinder();

  void start();
  void stop();

  // Enqueues and returns immediately.
  void submit(const std::string& backendId, std::string body);

  // Blocks until every submitted event has been handled.
  void drain();

  // Returns the bound channel id when the update added this backend's own
  // identity to a channel or supergroup.
  std::optional<std::string> handle(const std::string& backendId, const nlohmann::json& update);

private:
  void worker_loop();
  void process(const InboundEvent& ev);

  MetadataStore& store_;
  RelayTransport& transport_;

  std::atomic<bool> running_{false};
  std::thread worker_thread_;

  std::mutex queue_mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<InboundEvent> queue_;
  size_t in_flight_ = 0;
};

} // namespace rdg
