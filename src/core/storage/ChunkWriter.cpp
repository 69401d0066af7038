#include "ChunkWriter.hpp"

namespace rdg {

UploadedBytesSource::UploadedBytesSource(std::shared_ptr<const std::string> bytes, std::string contentHash)
  : bytes_(std::move(bytes)), hash_(std::move(contentHash)) {}

ExistingChunkSource::ExistingChunkSource(ChunkStore& store, ChunkLocation location)
  : store_(store), location_(std::move(location)) {}

std::shared_ptr<const std::string> ExistingChunkSource::read() {
  return store_.fetchChunk(location_);
}

ChunkWriter::ChunkWriter(ChunkStore& store) : store_(store) {}

ChunkRecord ChunkWriter::write(const std::string& fileId, int64_t index, ChunkSource& source,
                               const BackendRecord& backend) {
  auto bytes = source.read();
  return store_.putChunk(fileId, index, *bytes, source.contentHash(), backend);
}

} // namespace rdg
