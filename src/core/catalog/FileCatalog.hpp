#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/metadata/MetadataStore.hpp"
#include "core/storage/BackendPool.hpp"
#include "core/storage/ChunkStore.hpp"
#include "core/storage/ChunkWriter.hpp"

namespace rdg {

struct UploadRequest {
  std::string name;
  int64_t     size_bytes = 0;
  std::string mime_type;
  std::string content_hash;
  std::string folder;            // virtual folder, empty = root
  bool        is_public = false;
  std::string public_title;
  std::string public_category;
};

struct UploadPlan {
  std::string file_id;
  int64_t     chunk_count = 0;
  int64_t     chunk_size = 0;
  bool        duplicate = false; // file_id names the file already holding the content
  std::vector<PlacementEntry> placement;
};

// Unset fields are left as they are.
struct FileUpdate {
  std::optional<std::string> name;
  std::optional<std::string> folder;
  std::optional<bool>        is_public;
  std::optional<std::string> public_title;
  std::optional<std::string> public_category;
};

// "/" + folder + "/" + name, with redundant slashes collapsed at the joint.
std::string virtualPathFor(const std::string& folder, const std::string& name);

// Durable file metadata and the upload/read/fork workflows over it.
class FileCatalog {
public:
  FileCatalog(MetadataStore& store, BackendPool& pool, ChunkStore& chunks, ChunkWriter& writer);

  UploadPlan initUpload(const std::string& ownerId, const UploadRequest& req);

  ChunkRecord uploadChunk(const std::string& ownerId, const std::string& fileId, int64_t index,
                          std::shared_ptr<const std::string> bytes, const std::string& chunkHash);

  // Throws IncompleteUpload{have, want} until every index is stored.
  FileRecord completeUpload(const std::string& ownerId, const std::string& fileId);

  // A complete file the caller may read: its own, or anyone's public one.
  FileRecord resolve(const std::string& ownerId, const std::string& fileId);

  std::string readRange(const std::string& ownerId, const std::string& fileId,
                        int64_t start, int64_t endInclusive);

  // init + every chunk + complete in one call. Content hash and size are
  // taken from the bytes. A duplicate returns the existing file.
  FileRecord storeObject(const std::string& ownerId, UploadRequest meta, std::string_view bytes);

  FileRecord getFile(const std::string& ownerId, const std::string& fileId);
  std::vector<FileRecord> listFiles(const std::string& ownerId, const FileFilter& filter);
  FileRecord updateFile(const std::string& ownerId, const std::string& fileId, const FileUpdate& update);
  void deleteFile(const std::string& ownerId, const std::string& fileId);

  // Copies a public file of another owner onto newOwnerId's own backends.
  // A failed copy leaves nothing behind.
  FileRecord fork(const std::string& newOwnerId, const std::string& sourceFileId);

  void recordView(const std::string& fileId);

  int64_t chunkSize() const { return chunks_.chunkSize(); }

private:
  FileRecord requireOwned(const std::string& ownerId, const std::string& fileId);
  // Chunk size the file was planned with; rows from before it was stored
  // fall back to the configured size.
  int64_t chunkSizeOf(const FileRecord& f) const;
  UploadPlan duplicateOf(const std::string& ownerId, const std::string& contentHash);

  MetadataStore& store_;
  BackendPool& pool_;
  ChunkStore& chunks_;
  ChunkWriter& writer_;
};

} // namespace rdg
