#pragma once
#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/errors/GatewayError.hpp"
#include "RateLimiter.hpp"
#include "RelayTransport.hpp"

namespace httplib { class Client; }

namespace rdg {

// Maps a relay failure (HTTP status or API error_code plus description) onto
// the transport error taxonomy.
ErrorKind classifyRelayFailure(int code, const std::string& description);

struct TelegramTransportOptions {
  std::string base_url = "https://api.telegram.org";
  std::chrono::seconds timeout{60};
};

// Bot HTTP API relay. Every API method call first passes the shared
// per-credential RateLimiter.
class TelegramTransport : public RelayTransport {
public:
  TelegramTransport(TelegramTransportOptions opts, std::shared_ptr<RateLimiter> limiter);

  RelayIdentity identify(const std::string& credential) override;
  BlobPlacement putBlob(const std::string& credential, const std::string& channel,
                        std::string_view bytes, const std::string& name) override;
  std::string getBlobBytes(const std::string& credential, const std::string& blob_ref) override;
  std::optional<std::string> resolveBlobFromMessage(const std::string& credential,
                                                    const std::string& channel,
                                                    const std::string& message_ref) override;
  void sendNotice(const std::string& credential, const std::string& channel,
                  const std::string& text) override;

private:
  std::unique_ptr<httplib::Client> makeClient() const;
  nlohmann::json callJson(const std::string& credential, const std::string& method,
                          const nlohmann::json& params);
  void throttle(const std::string& credential, const std::string& method);

  TelegramTransportOptions opts_;
  std::shared_ptr<RateLimiter> limiter_;
};

} // namespace rdg
