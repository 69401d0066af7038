#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "ChunkStore.hpp"

namespace rdg {

// Where the bytes of one chunk come from.
class ChunkSource {
public:
  virtual ~ChunkSource() = default;
  virtual std::shared_ptr<const std::string> read() = 0;
  virtual const std::string& contentHash() const = 0;
};

// Bytes a client just sent, already checked against their hash.
class UploadedBytesSource : public ChunkSource {
public:
  UploadedBytesSource(std::shared_ptr<const std::string> bytes, std::string contentHash);

  std::shared_ptr<const std::string> read() override { return bytes_; }
  const std::string& contentHash() const override { return hash_; }

private:
  std::shared_ptr<const std::string> bytes_;
  std::string hash_;
};

// A chunk of another file, fetched (and repaired if needed) on read().
class ExistingChunkSource : public ChunkSource {
public:
  ExistingChunkSource(ChunkStore& store, ChunkLocation location);

  std::shared_ptr<const std::string> read() override;
  const std::string& contentHash() const override { return location_.chunk.content_hash; }

private:
  ChunkStore& store_;
  ChunkLocation location_;
};

// Read, place on the target backend, persist the record.
class ChunkWriter {
public:
  explicit ChunkWriter(ChunkStore& store);

  ChunkRecord write(const std::string& fileId, int64_t index, ChunkSource& source,
                    const BackendRecord& backend);

private:
  ChunkStore& store_;
};

} // namespace rdg
