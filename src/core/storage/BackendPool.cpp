#include "BackendPool.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/GatewayError.hpp"
#include "core/util/Encoding.hpp"

namespace rdg {

HealthStatus healthFromError(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::RateLimited:       return HealthStatus::RateLimited;
    case ErrorKind::InvalidCredential: return HealthStatus::Banned;
    default:                           return HealthStatus::Unknown;
  }
}

BackendPool::BackendPool(MetadataStore& store, RelayTransport& transport)
  : store_(store), transport_(transport) {}

std::vector<BackendRecord> BackendPool::placementPool(const std::string& ownerId) {
  auto pool = store_.healthyPool(ownerId);
  if (pool.empty()) {
    throw GatewayError(ErrorKind::NoBackendAvailable,
                       "no active healthy backend; register a backend first");
  }
  return pool;
}

BackendRecord BackendPool::selectBackend(int64_t chunkIndex, const std::string& ownerId) {
  if (chunkIndex < 0) {
    throw GatewayError(ErrorKind::InvalidChunkIndex, "negative chunk index");
  }
  auto pool = placementPool(ownerId);
  return pool[static_cast<size_t>(chunkIndex) % pool.size()];
}

std::vector<PlacementEntry> BackendPool::planPlacement(const std::string& ownerId, int64_t chunkCount) {
  auto pool = placementPool(ownerId);
  std::vector<PlacementEntry> plan;
  plan.reserve(static_cast<size_t>(chunkCount));
  for (int64_t i = 0; i < chunkCount; ++i) {
    plan.push_back(PlacementEntry{i, pool[static_cast<size_t>(i) % pool.size()].backend_id});
  }
  return plan;
}

HealthStatus BackendPool::checkHealth(const BackendRecord& backend) {
  HealthStatus status = HealthStatus::Healthy;
  try {
    RelayIdentity id = transport_.identify(backend.credential);
    if (!id.is_bot) status = HealthStatus::Banned;
  } catch (const GatewayError& e) {
    status = healthFromError(e.kind());
    spdlog::warn("backend {} health check: {} ({})",
                 backend.backend_id, healthStatusName(status), e.what());
  }
  store_.updateBackendHealth(backend.backend_id, status, now_seconds());
  return status;
}

BackendRecord BackendPool::checkHealth(const std::string& ownerId, const std::string& backendId) {
  BackendRecord b = requireOwned(ownerId, backendId);
  checkHealth(b);
  return requireOwned(ownerId, backendId);
}

size_t BackendPool::checkAll() {
  size_t healthy = 0;
  for (const auto& b : store_.listAllActiveBackends()) {
    if (checkHealth(b) == HealthStatus::Healthy) ++healthy;
  }
  return healthy;
}

BackendRecord BackendPool::registerBackend(const std::string& ownerId, const std::string& credential) {
  if (credential.empty()) {
    throw GatewayError(ErrorKind::InvalidRequest, "credential required");
  }
  RelayIdentity id = transport_.identify(credential);
  if (!id.is_bot) {
    throw GatewayError(ErrorKind::InvalidCredential, "credential does not belong to a bot");
  }

  const int64_t now = now_seconds();
  if (auto existing = store_.findBackendByIdentity(ownerId, id.id)) {
    if (existing->is_active) {
      throw GatewayError(ErrorKind::InvalidRequest,
                         "backend already registered: " + existing->backend_id);
    }
    store_.reactivateBackend(existing->backend_id, credential, id.username, now);
    spdlog::info("backend {} reactivated for owner {}", existing->backend_id, ownerId);
    return requireOwned(ownerId, existing->backend_id);
  }

  BackendRecord b;
  b.backend_id        = "bk_" + uuid4();
  b.owner_id          = ownerId;
  b.credential        = credential;
  b.remote_identity   = id.id;
  b.display_name      = id.username;
  b.is_active         = true;
  b.health_status     = HealthStatus::Healthy;
  b.last_health_check = now;
  b.created_at        = now;
  store_.insertBackend(b);
  spdlog::info("backend {} registered for owner {} ({})", b.backend_id, ownerId, redact(credential));
  return b;
}

BackendRecord BackendPool::bindChannel(const std::string& ownerId, const std::string& backendId,
                                       const std::string& channelId) {
  if (channelId.empty()) {
    throw GatewayError(ErrorKind::InvalidRequest, "channel_id required");
  }
  requireOwned(ownerId, backendId);
  store_.setBackendChannel(backendId, channelId);
  spdlog::info("backend {} bound to channel {}", backendId, channelId);
  return requireOwned(ownerId, backendId);
}

void BackendPool::deactivateBackend(const std::string& ownerId, const std::string& backendId) {
  BackendRecord b = requireOwned(ownerId, backendId);
  if (!store_.setBackendActive(b.backend_id, false)) {
    throw GatewayError(ErrorKind::BackendNotFound, "backend already removed: " + backendId);
  }
  spdlog::info("backend {} deactivated", backendId);
}

std::vector<BackendRecord> BackendPool::listBackends(const std::string& ownerId) {
  return store_.listActiveBackends(ownerId);
}

BackendRecord BackendPool::requireOwned(const std::string& ownerId, const std::string& backendId) {
  auto b = store_.findBackend(backendId);
  if (!b || b->owner_id != ownerId) {
    throw GatewayError(ErrorKind::BackendNotFound, "backend not found: " + backendId);
  }
  return *b;
}

} // namespace rdg
