#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace rdg {

struct RelayIdentity {
  std::string id;
  std::string username;
  std::string display_name;
  bool        is_bot = true;
};

struct BlobPlacement {
  std::string message_ref;   // durable: the relay's own log entry
  std::string blob_ref;      // primary fetch handle, may go stale
};

// The remote message relay chunks are parked on. Implementations report
// failures as GatewayError with kind InvalidCredential, RateLimited,
// BlobNotFound or TransportUnavailable.
class RelayTransport {
public:
  virtual ~RelayTransport() = default;

  virtual RelayIdentity identify(const std::string& credential) = 0;

  virtual BlobPlacement putBlob(const std::string& credential,
                                const std::string& channel,
                                std::string_view bytes,
                                const std::string& name) = 0;

  virtual std::string getBlobBytes(const std::string& credential,
                                   const std::string& blob_ref) = 0;

  // nullopt when the message no longer exists or carries no blob.
  virtual std::optional<std::string> resolveBlobFromMessage(const std::string& credential,
                                                            const std::string& channel,
                                                            const std::string& message_ref) = 0;

  virtual void sendNotice(const std::string& credential,
                          const std::string& channel,
                          const std::string& text) = 0;
};

} // namespace rdg
