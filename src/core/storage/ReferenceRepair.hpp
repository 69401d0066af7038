#pragma once
#include <string>

#include "core/metadata/MetadataStore.hpp"
#include "core/transport/RelayTransport.hpp"

namespace rdg {

// Fallback for stale blob references: asks the relay to re-expose the blob
// behind the chunk's durable message reference and rewrites the record.
class ReferenceRepair {
public:
  ReferenceRepair(MetadataStore& store, RelayTransport& transport);

  // Returns the new blob reference, already persisted on the chunk record.
  // Throws GatewayError(RepairFailed).
  std::string repair(const ChunkRecord& chunk, const BackendRecord& backend);

private:
  MetadataStore& store_;
  RelayTransport& transport_;
};

} // namespace rdg
