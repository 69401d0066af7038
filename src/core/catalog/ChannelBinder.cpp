#include "ChannelBinder.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/GatewayError.hpp"

using nlohmann::json;

namespace rdg {

static const char* kBoundNotice =
  "relay-drive: channel configured automatically. You can now upload files.";

// Relay ids arrive as JSON numbers; stored ones are strings.
static std::string idString(const json& v) {
  if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
  if (v.is_string()) return v.get<std::string>();
  return {};
}

static bool isChannelLike(const json& chat) {
  if (!chat.is_object() || !chat.contains("type") || !chat["type"].is_string()) return false;
  const auto type = chat["type"].get<std::string>();
  return type == "channel" || type == "supergroup";
}

ChannelBinder::ChannelBinder(MetadataStore& store, RelayTransport& transport)
  : store_(store), transport_(transport) {}

ChannelBinder::~ChannelBinder() { stop(); }

void ChannelBinder::start() {
  if (running_.exchange(true)) return;
  worker_thread_ = std::thread([this] { worker_loop(); });
}

void ChannelBinder::stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
}

void ChannelBinder::submit(const std::string& backendId, std::string body) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push(InboundEvent{backendId, std::move(body)});
  }
  cv_.notify_one();
}

void ChannelBinder::drain() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_cv_.wait(lock, [this] { return (queue_.empty() && in_flight_ == 0) || !running_; });
}

void ChannelBinder::worker_loop() {
  while (true) {
    InboundEvent ev;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (!running_) break;
      ev = std::move(queue_.front());
      queue_.pop();
      ++in_flight_;
    }
    process(ev);
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      --in_flight_;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void ChannelBinder::process(const InboundEvent& ev) {
  try {
    json update = json::parse(ev.body);
    handle(ev.backend_id, update);
  } catch (const json::exception& e) {
    spdlog::warn("webhook for {}: unreadable update ({})", ev.backend_id, e.what());
  } catch (const std::exception& e) {
    spdlog::error("webhook for {}: {}", ev.backend_id, e.what());
  }
}

std::optional<std::string> ChannelBinder::handle(const std::string& backendId, const json& update) {
  if (!update.is_object()) return std::nullopt;

  auto backend = store_.findBackend(backendId);
  if (!backend || !backend->is_active) {
    spdlog::debug("webhook for unknown or inactive backend {}", backendId);
    return std::nullopt;
  }

  std::optional<std::string> channel;

  // Shape 1: service message listing new chat members.
  if (update.contains("message") && update["message"].is_object()) {
    const json& msg = update["message"];
    if (msg.contains("new_chat_members") && msg["new_chat_members"].is_array() &&
        msg.contains("chat") && isChannelLike(msg["chat"])) {
      for (const auto& m : msg["new_chat_members"]) {
        if (!m.is_object() || !m.contains("id")) continue;
        const bool isBot = m.value("is_bot", false);
        if (isBot && idString(m["id"]) == backend->remote_identity) {
          channel = idString(msg["chat"]["id"]);
          break;
        }
      }
    }
  }

  // Shape 2: chat_member status change.
  if (!channel && update.contains("chat_member") && update["chat_member"].is_object()) {
    const json& cm = update["chat_member"];
    if (cm.contains("chat") && isChannelLike(cm["chat"]) &&
        cm.contains("new_chat_member") && cm["new_chat_member"].is_object()) {
      const json& member = cm["new_chat_member"];
      const std::string status = member.value("status", "");
      const bool joined = status == "administrator" || status == "member";
      if (joined && member.contains("user") && member["user"].is_object() &&
          member["user"].contains("id") && idString(member["user"]["id"]) == backend->remote_identity) {
        channel = idString(cm["chat"]["id"]);
      }
    }
  }

  if (!channel || channel->empty()) return std::nullopt;

  store_.setBackendChannel(backendId, *channel);
  spdlog::info("backend {} auto-bound to channel {}", backendId, *channel);

  try {
    transport_.sendNotice(backend->credential, *channel, kBoundNotice);
  } catch (const GatewayError& e) {
    spdlog::warn("backend {}: confirmation notice not sent ({})", backendId, e.what());
  }
  return channel;
}

} // namespace rdg
