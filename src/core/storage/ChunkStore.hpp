#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/metadata/MetadataStore.hpp"
#include "core/transport/RelayTransport.hpp"
#include "ChunkCache.hpp"
#include "RangeResolver.hpp"
#include "ReferenceRepair.hpp"

namespace rdg {

// ceil(size / chunkSize)
int64_t chunkCountFor(int64_t sizeBytes, int64_t chunkSize);
// Length chunk `index` must have: chunkSize, except the remainder in the last.
int64_t expectedChunkLength(int64_t sizeBytes, int64_t chunkSize, int64_t index);
std::vector<std::string_view> splitIntoChunks(std::string_view payload, int64_t chunkSize);
std::string chunkIdFor(const std::string& fileId, int64_t index);

// Places chunk bytes on relay backends and reassembles byte ranges from them.
class ChunkStore {
public:
  ChunkStore(MetadataStore& store, RelayTransport& transport, ReferenceRepair& repair,
             std::shared_ptr<ChunkCache> cache, int64_t chunkSize);

  int64_t chunkSize() const { return chunkSize_; }

  // Uploads to the backend's channel and records (or re-records) the chunk.
  ChunkRecord putChunk(const std::string& fileId, int64_t index, std::string_view bytes,
                       const std::string& contentHash, const BackendRecord& backend);

  // Bytes [start, endInclusive] of a completely uploaded file.
  std::string getRange(const std::string& fileId, int64_t start, int64_t endInclusive);

  // Up to maxLen bytes from offset, never crossing the end of the chunk that
  // holds offset. Used to stream one chunk at a time.
  std::string readSpan(const std::string& fileId, int64_t offset, int64_t maxLen);

  // Throws what getRange would throw before any byte is fetched
  // (FileNotFound, IncompleteUpload, RangeNotSatisfiable, ChunksUnavailable).
  void checkReadable(const std::string& fileId, int64_t start, int64_t endInclusive);

  // Whole, integrity-checked chunk; repairs a stale reference once.
  std::shared_ptr<const std::string> fetchChunk(const ChunkLocation& loc);

private:
  struct Layout {
    FileRecord file;
    std::vector<ChunkLocation> chunks;
    std::vector<int64_t> sizes;
    int64_t total = 0;
  };

  Layout loadLayout(const std::string& fileId);
  std::vector<ChunkSlice> planRead(const Layout& layout, int64_t start, int64_t end) const;
  std::string assemble(const Layout& layout, const std::vector<ChunkSlice>& slices);
  std::string download(const ChunkRecord& chunk, const BackendRecord& backend,
                       const std::string& blobRef);

  MetadataStore& store_;
  RelayTransport& transport_;
  ReferenceRepair& repair_;
  std::shared_ptr<ChunkCache> cache_;
  int64_t chunkSize_;
};

} // namespace rdg
