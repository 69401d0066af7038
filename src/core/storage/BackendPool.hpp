#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "core/errors/GatewayError.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/transport/RelayTransport.hpp"

namespace rdg {

// Tracks an owner's relay backends and decides chunk placement.
class BackendPool {
public:
  BackendPool(MetadataStore& store, RelayTransport& transport);

  // Active, healthy backends of the owner, most recently checked first.
  // Throws NoBackendAvailable when empty.
  std::vector<BackendRecord> placementPool(const std::string& ownerId);

  // pool[chunkIndex mod |pool|]
  BackendRecord selectBackend(int64_t chunkIndex, const std::string& ownerId);

  // One entry per chunk index, drawn from a single snapshot of the pool.
  std::vector<PlacementEntry> planPlacement(const std::string& ownerId, int64_t chunkCount);

  // Checks the credential and records the outcome with the check time.
  HealthStatus checkHealth(const BackendRecord& backend);
  BackendRecord checkHealth(const std::string& ownerId, const std::string& backendId);
  // Checks every active backend; returns how many came back healthy.
  size_t checkAll();

  BackendRecord registerBackend(const std::string& ownerId, const std::string& credential);
  BackendRecord bindChannel(const std::string& ownerId, const std::string& backendId,
                            const std::string& channelId);
  void deactivateBackend(const std::string& ownerId, const std::string& backendId);
  std::vector<BackendRecord> listBackends(const std::string& ownerId);

  BackendRecord requireOwned(const std::string& ownerId, const std::string& backendId);

private:
  MetadataStore& store_;
  RelayTransport& transport_;
};

HealthStatus healthFromError(ErrorKind kind);

} // namespace rdg
