#include "ReferenceRepair.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/GatewayError.hpp"

namespace rdg {

ReferenceRepair::ReferenceRepair(MetadataStore& store, RelayTransport& transport)
  : store_(store), transport_(transport) {}

std::string ReferenceRepair::repair(const ChunkRecord& chunk, const BackendRecord& backend) {
  const std::string& channel =
    chunk.remote_channel_id.empty() ? backend.remote_channel_id : chunk.remote_channel_id;
  if (channel.empty() || chunk.remote_message_ref.empty()) {
    throw GatewayError(ErrorKind::RepairFailed,
                       "chunk " + std::to_string(chunk.chunk_index) + " has no message reference")
      .withChunkIndex(chunk.chunk_index);
  }

  std::optional<std::string> fresh;
  try {
    fresh = transport_.resolveBlobFromMessage(backend.credential, channel, chunk.remote_message_ref);
  } catch (const GatewayError& e) {
    throw GatewayError(ErrorKind::RepairFailed,
                       "chunk " + std::to_string(chunk.chunk_index) + ": " + e.what())
      .withChunkIndex(chunk.chunk_index);
  }
  if (!fresh || fresh->empty()) {
    throw GatewayError(ErrorKind::RepairFailed,
                       "message " + chunk.remote_message_ref + " in " + channel +
                       " no longer carries chunk " + std::to_string(chunk.chunk_index))
      .withChunkIndex(chunk.chunk_index);
  }

  store_.updateChunkBlobRef(chunk.chunk_id, *fresh);
  spdlog::info("chunk {} of {} re-referenced from message {}",
               chunk.chunk_index, chunk.file_id, chunk.remote_message_ref);
  return *fresh;
}

} // namespace rdg
