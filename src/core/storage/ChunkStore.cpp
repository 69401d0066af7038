#include "ChunkStore.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/errors/GatewayError.hpp"
#include "core/util/Encoding.hpp"

namespace rdg {

int64_t chunkCountFor(int64_t sizeBytes, int64_t chunkSize) {
  if (sizeBytes <= 0) return 0;
  return (sizeBytes + chunkSize - 1) / chunkSize;
}

int64_t expectedChunkLength(int64_t sizeBytes, int64_t chunkSize, int64_t index) {
  const int64_t count = chunkCountFor(sizeBytes, chunkSize);
  if (index < 0 || index >= count) return 0;
  if (index < count - 1) return chunkSize;
  return sizeBytes - chunkSize * (count - 1);
}

std::vector<std::string_view> splitIntoChunks(std::string_view payload, int64_t chunkSize) {
  std::vector<std::string_view> out;
  const size_t step = static_cast<size_t>(chunkSize);
  for (size_t off = 0; off < payload.size(); off += step) {
    out.push_back(payload.substr(off, step));
  }
  return out;
}

std::string chunkIdFor(const std::string& fileId, int64_t index) {
  return "chunk_" + fileId + "_" + std::to_string(index);
}

ChunkStore::ChunkStore(MetadataStore& store, RelayTransport& transport, ReferenceRepair& repair,
                       std::shared_ptr<ChunkCache> cache, int64_t chunkSize)
  : store_(store), transport_(transport), repair_(repair), cache_(std::move(cache)),
    chunkSize_(chunkSize) {
  if (chunkSize_ <= 0) {
    throw GatewayError(ErrorKind::ConfigError, "chunk size must be positive");
  }
}

ChunkRecord ChunkStore::putChunk(const std::string& fileId, int64_t index, std::string_view bytes,
                                 const std::string& contentHash, const BackendRecord& backend) {
  if (backend.remote_channel_id.empty()) {
    throw GatewayError(ErrorKind::BackendChannelNotConfigured,
                       "backend " + backend.backend_id + " has no channel bound")
      .withChunkIndex(index);
  }
  if (!backend.is_active) {
    throw GatewayError(ErrorKind::NoBackendAvailable,
                       "backend " + backend.backend_id + " is no longer active")
      .withChunkIndex(index);
  }

  BlobPlacement placed;
  try {
    placed = transport_.putBlob(backend.credential, backend.remote_channel_id, bytes,
                                "chunk_" + std::to_string(index) + ".bin");
  } catch (const GatewayError& e) {
    throw GatewayError(e.kind(), "chunk " + std::to_string(index) + " upload: " + e.what())
      .withChunkIndex(index);
  }

  ChunkRecord rec;
  rec.chunk_id           = chunkIdFor(fileId, index);
  rec.file_id            = fileId;
  rec.chunk_index        = index;
  rec.byte_size          = static_cast<int64_t>(bytes.size());
  rec.content_hash       = contentHash;
  rec.backend_id         = backend.backend_id;
  rec.remote_channel_id  = backend.remote_channel_id;
  rec.remote_message_ref = placed.message_ref;
  rec.remote_blob_ref    = placed.blob_ref;
  rec.created_at         = now_seconds();
  store_.upsertChunk(rec);
  if (cache_) cache_->erase(rec.chunk_id);

  spdlog::debug("chunk {} of {} ({} bytes) placed on {}", index, fileId, bytes.size(),
                backend.backend_id);
  return rec;
}

ChunkStore::Layout ChunkStore::loadLayout(const std::string& fileId) {
  auto file = store_.findFile(fileId);
  if (!file || file->is_deleted) {
    throw GatewayError(ErrorKind::FileNotFound, "file not found: " + fileId);
  }
  Layout layout;
  layout.file = *file;
  layout.chunks = store_.chunkLocations(fileId);

  const int64_t have = static_cast<int64_t>(layout.chunks.size());
  bool contiguous = have == file->chunk_count;
  for (int64_t i = 0; contiguous && i < have; ++i) {
    contiguous = layout.chunks[static_cast<size_t>(i)].chunk.chunk_index == i;
  }
  if (!contiguous) {
    throw GatewayError(ErrorKind::IncompleteUpload,
                       "file " + fileId + " has " + std::to_string(have) + " of " +
                       std::to_string(file->chunk_count) + " chunks")
      .withCounts(have, file->chunk_count);
  }

  layout.sizes.reserve(layout.chunks.size());
  for (const auto& loc : layout.chunks) {
    layout.sizes.push_back(loc.chunk.byte_size);
    layout.total += loc.chunk.byte_size;
  }
  if (layout.total != file->size_bytes) {
    throw GatewayError(ErrorKind::StorageFailure,
                       "chunk sizes of " + fileId + " add up to " + std::to_string(layout.total) +
                       ", expected " + std::to_string(file->size_bytes));
  }
  return layout;
}

std::vector<ChunkSlice> ChunkStore::planRead(const Layout& layout, int64_t start, int64_t end) const {
  if (start < 0 || end < start || end >= layout.total) {
    throw GatewayError(ErrorKind::RangeNotSatisfiable,
                       "range " + std::to_string(start) + "-" + std::to_string(end) +
                       " outside 0-" + std::to_string(layout.total - 1));
  }
  auto slices = resolveRange(layout.sizes, start, end);
  // A hole would shift every later byte, so one unreadable chunk fails the read.
  for (const auto& s : slices) {
    const ChunkLocation& loc = layout.chunks[s.position];
    if (!loc.readable()) {
      throw GatewayError(ErrorKind::ChunksUnavailable,
                         "chunk " + std::to_string(loc.chunk.chunk_index) + " is on backend " +
                         loc.backend.backend_id + ", which is inactive or has no channel")
        .withChunkIndex(loc.chunk.chunk_index);
    }
  }
  return slices;
}

std::string ChunkStore::assemble(const Layout& layout, const std::vector<ChunkSlice>& slices) {
  int64_t total = 0;
  for (const auto& s : slices) total += s.length();
  std::string out;
  out.reserve(static_cast<size_t>(total));
  for (const auto& s : slices) {
    auto bytes = fetchChunk(layout.chunks[s.position]);
    out.append(*bytes, static_cast<size_t>(s.local_start), static_cast<size_t>(s.length()));
  }
  return out;
}

std::string ChunkStore::getRange(const std::string& fileId, int64_t start, int64_t endInclusive) {
  Layout layout = loadLayout(fileId);
  return assemble(layout, planRead(layout, start, endInclusive));
}

std::string ChunkStore::readSpan(const std::string& fileId, int64_t offset, int64_t maxLen) {
  Layout layout = loadLayout(fileId);
  if (maxLen <= 0) return {};
  int64_t chunkEnd = 0;   // exclusive end of the chunk holding offset
  for (int64_t size : layout.sizes) {
    chunkEnd += size;
    if (offset < chunkEnd) break;
  }
  const int64_t end = std::min(offset + maxLen, chunkEnd) - 1;
  return assemble(layout, planRead(layout, offset, end));
}

void ChunkStore::checkReadable(const std::string& fileId, int64_t start, int64_t endInclusive) {
  Layout layout = loadLayout(fileId);
  planRead(layout, start, endInclusive);
}

std::string ChunkStore::download(const ChunkRecord& chunk, const BackendRecord& backend,
                                 const std::string& blobRef) {
  std::string bytes = transport_.getBlobBytes(backend.credential, blobRef);
  if (static_cast<int64_t>(bytes.size()) != chunk.byte_size || sha256_hex(bytes) != chunk.content_hash) {
    throw GatewayError(ErrorKind::ChunkHashMismatch,
                       "chunk " + std::to_string(chunk.chunk_index) + " failed its integrity check");
  }
  return bytes;
}

std::shared_ptr<const std::string> ChunkStore::fetchChunk(const ChunkLocation& loc) {
  const ChunkRecord& chunk = loc.chunk;
  if (!loc.readable()) {
    throw GatewayError(ErrorKind::ChunksUnavailable,
                       "chunk " + std::to_string(chunk.chunk_index) + " is on an unavailable backend")
      .withChunkIndex(chunk.chunk_index);
  }
  if (cache_) {
    if (auto hit = cache_->get(chunk.chunk_id)) return hit;
  }

  std::string bytes;
  try {
    bytes = download(chunk, loc.backend, chunk.remote_blob_ref);
  } catch (const GatewayError& first) {
    const std::string where = "chunk " + std::to_string(chunk.chunk_index) + " of " + chunk.file_id;
    if (first.kind() == ErrorKind::InvalidCredential) {
      throw GatewayError(ErrorKind::ChunkFetchFailed, where + ": " + first.what())
        .withChunkIndex(chunk.chunk_index);
    }
    spdlog::warn("{}: {}; trying message fallback", where, first.what());

    std::string fresh;
    try {
      fresh = repair_.repair(chunk, loc.backend);
    } catch (const GatewayError& e) {
      throw GatewayError(ErrorKind::ChunkFetchFailed,
                         where + ": " + first.what() + "; " + e.what())
        .withChunkIndex(chunk.chunk_index);
    }
    try {
      bytes = download(chunk, loc.backend, fresh);
    } catch (const GatewayError& e) {
      throw GatewayError(ErrorKind::ChunkFetchFailed,
                         where + " after repair: " + e.what())
        .withChunkIndex(chunk.chunk_index);
    }
  }

  auto shared = std::make_shared<const std::string>(std::move(bytes));
  if (cache_) cache_->put(chunk.chunk_id, shared);
  return shared;
}

} // namespace rdg
