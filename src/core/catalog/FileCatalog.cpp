#include "FileCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "core/errors/GatewayError.hpp"
#include "core/util/Encoding.hpp"

namespace rdg {

static std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string requireHash(const std::string& hash, const char* field) {
  std::string h = lowercase(hash);
  if (!is_sha256_hex(h)) {
    throw GatewayError(ErrorKind::InvalidRequest,
                       std::string(field) + " must be a hex SHA-256 digest");
  }
  return h;
}

static void requireName(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos) {
    throw GatewayError(ErrorKind::InvalidRequest, "name must be non-empty and contain no '/'");
  }
  for (unsigned char c : name) {
    if (c < 0x20 || c == 0x7f) {
      throw GatewayError(ErrorKind::InvalidRequest, "name must not contain control characters");
    }
  }
}

std::string virtualPathFor(const std::string& folder, const std::string& name) {
  std::string dir = folder;
  while (!dir.empty() && dir.back() == '/') dir.pop_back();
  size_t lead = 0;
  while (lead < dir.size() && dir[lead] == '/') ++lead;
  dir.erase(0, lead);
  if (dir.empty()) return "/" + name;
  return "/" + dir + "/" + name;
}

static std::string folderOf(const std::string& virtualPath) {
  auto slash = virtualPath.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return "";
  return virtualPath.substr(0, slash);
}

int64_t FileCatalog::chunkSizeOf(const FileRecord& f) const {
  return f.chunk_size > 0 ? f.chunk_size : chunks_.chunkSize();
}

FileCatalog::FileCatalog(MetadataStore& store, BackendPool& pool, ChunkStore& chunks, ChunkWriter& writer)
  : store_(store), pool_(pool), chunks_(chunks), writer_(writer) {}

UploadPlan FileCatalog::duplicateOf(const std::string& ownerId, const std::string& contentHash) {
  auto existing = store_.findLiveFileByHash(ownerId, contentHash);
  if (!existing) {
    throw GatewayError(ErrorKind::StorageFailure, "content conflict without a live file");
  }
  UploadPlan plan;
  plan.file_id     = existing->file_id;
  plan.chunk_count = existing->chunk_count;
  plan.chunk_size  = chunkSizeOf(*existing);
  plan.duplicate   = true;
  plan.placement   = store_.loadPlan(existing->file_id);
  return plan;
}

UploadPlan FileCatalog::initUpload(const std::string& ownerId, const UploadRequest& req) {
  requireName(req.name);
  if (req.size_bytes <= 0) {
    throw GatewayError(ErrorKind::InvalidRequest, "size must be positive");
  }
  const std::string hash = requireHash(req.content_hash, "content_hash");

  // Fast path; the unique index below settles races.
  if (store_.findLiveFileByHash(ownerId, hash)) {
    spdlog::info("upload of {} by {} deduplicated", req.name, ownerId);
    return duplicateOf(ownerId, hash);
  }

  const int64_t count = chunkCountFor(req.size_bytes, chunks_.chunkSize());
  std::vector<PlacementEntry> placement = pool_.planPlacement(ownerId, count);

  const int64_t now = now_seconds();
  FileRecord f;
  f.file_id         = "file_" + uuid4();
  f.owner_id        = ownerId;
  f.name            = req.name;
  f.virtual_path    = virtualPathFor(req.folder, req.name);
  f.size_bytes      = req.size_bytes;
  f.mime_type       = req.mime_type;
  f.content_hash    = hash;
  f.chunk_count     = count;
  f.chunk_size      = chunks_.chunkSize();
  f.is_public       = req.is_public;
  f.public_title    = req.public_title;
  f.public_category = req.public_category;
  f.created_at      = now;
  f.updated_at      = now;

  bool inserted = false;
  {
    MetadataStore::Transaction tx(store_);
    inserted = store_.insertFile(f);
    if (inserted) {
      store_.insertPlan(f.file_id, placement);
      tx.commit();
    }
  }
  if (!inserted) {
    spdlog::info("upload of {} by {} lost a dedup race", req.name, ownerId);
    return duplicateOf(ownerId, hash);
  }

  spdlog::info("upload {} started: {} bytes in {} chunks", f.file_id, f.size_bytes, count);
  UploadPlan plan;
  plan.file_id     = f.file_id;
  plan.chunk_count = count;
  plan.chunk_size  = f.chunk_size;
  plan.placement   = std::move(placement);
  return plan;
}

ChunkRecord FileCatalog::uploadChunk(const std::string& ownerId, const std::string& fileId, int64_t index,
                                     std::shared_ptr<const std::string> bytes, const std::string& chunkHash) {
  FileRecord f = requireOwned(ownerId, fileId);
  if (index < 0 || index >= f.chunk_count) {
    throw GatewayError(ErrorKind::InvalidChunkIndex,
                       "chunk index " + std::to_string(index) + " outside 0-" +
                       std::to_string(f.chunk_count - 1))
      .withChunkIndex(index);
  }
  if (!bytes) {
    throw GatewayError(ErrorKind::InvalidRequest, "chunk body required");
  }
  const int64_t want = expectedChunkLength(f.size_bytes, chunkSizeOf(f), index);
  if (static_cast<int64_t>(bytes->size()) != want) {
    throw GatewayError(ErrorKind::InvalidRequest,
                       "chunk " + std::to_string(index) + " must be " + std::to_string(want) +
                       " bytes, got " + std::to_string(bytes->size()))
      .withChunkIndex(index);
  }
  const std::string hash = requireHash(chunkHash, "chunk_hash");
  if (sha256_hex(*bytes) != hash) {
    throw GatewayError(ErrorKind::ChunkHashMismatch,
                       "chunk " + std::to_string(index) + " does not match its hash")
      .withChunkIndex(index);
  }

  auto backendId = store_.plannedBackend(fileId, index);
  if (!backendId) {
    throw GatewayError(ErrorKind::StorageFailure,
                       "no placement recorded for chunk " + std::to_string(index) + " of " + fileId);
  }
  auto backend = store_.findBackend(*backendId);
  if (!backend || !backend->is_active) {
    throw GatewayError(ErrorKind::NoBackendAvailable,
                       "backend " + *backendId + " planned for chunk " + std::to_string(index) +
                       " is no longer active")
      .withChunkIndex(index);
  }

  UploadedBytesSource source(std::move(bytes), hash);
  ChunkRecord rec = writer_.write(fileId, index, source, *backend);
  store_.touchFile(fileId, now_seconds());
  return rec;
}

FileRecord FileCatalog::completeUpload(const std::string& ownerId, const std::string& fileId) {
  FileRecord f = requireOwned(ownerId, fileId);
  const int64_t have = store_.countChunks(fileId);
  if (have != f.chunk_count) {
    throw GatewayError(ErrorKind::IncompleteUpload,
                       "not all chunks uploaded: " + std::to_string(have) + " of " +
                       std::to_string(f.chunk_count))
      .withCounts(have, f.chunk_count);
  }
  f.updated_at = now_seconds();
  store_.touchFile(fileId, f.updated_at);
  spdlog::info("upload {} complete ({} chunks)", fileId, f.chunk_count);
  return f;
}

FileRecord FileCatalog::resolve(const std::string& ownerId, const std::string& fileId) {
  auto f = store_.findFile(fileId);
  if (!f || f->is_deleted || (f->owner_id != ownerId && !f->is_public)) {
    throw GatewayError(ErrorKind::FileNotFound, "file not found: " + fileId);
  }
  const int64_t have = store_.countChunks(fileId);
  if (have != f->chunk_count) {
    throw GatewayError(ErrorKind::IncompleteUpload,
                       "file " + fileId + " is still uploading: " + std::to_string(have) + " of " +
                       std::to_string(f->chunk_count) + " chunks")
      .withCounts(have, f->chunk_count);
  }
  return *f;
}

std::string FileCatalog::readRange(const std::string& ownerId, const std::string& fileId,
                                   int64_t start, int64_t endInclusive) {
  resolve(ownerId, fileId);
  return chunks_.getRange(fileId, start, endInclusive);
}

FileRecord FileCatalog::storeObject(const std::string& ownerId, UploadRequest meta, std::string_view bytes) {
  meta.size_bytes   = static_cast<int64_t>(bytes.size());
  meta.content_hash = sha256_hex(bytes);
  UploadPlan plan = initUpload(ownerId, meta);
  if (plan.duplicate) return getFile(ownerId, plan.file_id);

  auto pieces = splitIntoChunks(bytes, plan.chunk_size);
  for (size_t i = 0; i < pieces.size(); ++i) {
    auto chunk = std::make_shared<const std::string>(pieces[i]);
    uploadChunk(ownerId, plan.file_id, static_cast<int64_t>(i), chunk, sha256_hex(*chunk));
  }
  return completeUpload(ownerId, plan.file_id);
}

FileRecord FileCatalog::getFile(const std::string& ownerId, const std::string& fileId) {
  return requireOwned(ownerId, fileId);
}

std::vector<FileRecord> FileCatalog::listFiles(const std::string& ownerId, const FileFilter& filter) {
  if (filter.limit <= 0 || filter.limit > 500 || filter.offset < 0) {
    throw GatewayError(ErrorKind::InvalidRequest, "limit must be 1-500 and offset non-negative");
  }
  return store_.listFiles(ownerId, filter);
}

FileRecord FileCatalog::updateFile(const std::string& ownerId, const std::string& fileId,
                                   const FileUpdate& update) {
  FileRecord f = requireOwned(ownerId, fileId);
  if (update.name) {
    requireName(*update.name);
    f.name = *update.name;
  }
  const std::string folder = update.folder ? *update.folder : folderOf(f.virtual_path);
  f.virtual_path = virtualPathFor(folder, f.name);
  if (update.is_public)       f.is_public = *update.is_public;
  if (update.public_title)    f.public_title = *update.public_title;
  if (update.public_category) f.public_category = *update.public_category;
  f.updated_at = now_seconds();
  store_.updateFileMeta(f);
  return f;
}

void FileCatalog::deleteFile(const std::string& ownerId, const std::string& fileId) {
  requireOwned(ownerId, fileId);
  if (!store_.softDeleteFile(fileId, now_seconds())) {
    throw GatewayError(ErrorKind::FileNotFound, "file not found: " + fileId);
  }
  spdlog::info("file {} deleted by {}", fileId, ownerId);
}

FileRecord FileCatalog::fork(const std::string& newOwnerId, const std::string& sourceFileId) {
  auto src = store_.findFile(sourceFileId);
  if (!src || src->is_deleted || !src->is_public) {
    throw GatewayError(ErrorKind::FileNotFound, "file not found or not public: " + sourceFileId);
  }
  if (src->owner_id == newOwnerId) {
    throw GatewayError(ErrorKind::InvalidRequest, "cannot fork your own file");
  }
  if (auto existing = store_.findLiveFileByHash(newOwnerId, src->content_hash)) {
    throw GatewayError(ErrorKind::DuplicateContent, "file already forked")
      .withExistingFile(existing->file_id);
  }

  std::vector<ChunkLocation> sources = store_.chunkLocations(sourceFileId);
  if (static_cast<int64_t>(sources.size()) != src->chunk_count) {
    throw GatewayError(ErrorKind::IncompleteUpload, "source file is still uploading")
      .withCounts(static_cast<int64_t>(sources.size()), src->chunk_count);
  }

  std::vector<PlacementEntry> placement = pool_.planPlacement(newOwnerId, src->chunk_count);
  std::unordered_map<std::string, BackendRecord> targets;
  for (const auto& p : placement) {
    if (targets.count(p.backend_id)) continue;
    auto b = store_.findBackend(p.backend_id);
    if (!b) throw GatewayError(ErrorKind::BackendNotFound, "backend not found: " + p.backend_id);
    targets.emplace(p.backend_id, *b);
  }

  const int64_t now = now_seconds();
  FileRecord f = *src;
  f.file_id           = "file_" + uuid4();
  f.owner_id          = newOwnerId;
  f.is_public         = false;
  f.public_title.clear();
  f.public_category.clear();
  f.forked_from_file  = src->file_id;
  f.forked_from_owner = src->owner_id;
  f.view_count        = 0;
  f.fork_count        = 0;
  f.created_at        = now;
  f.updated_at        = now;

  {
    MetadataStore::Transaction tx(store_);
    if (!store_.insertFile(f)) {
      auto existing = store_.findLiveFileByHash(newOwnerId, f.content_hash);
      throw GatewayError(ErrorKind::DuplicateContent, "file already forked")
        .withExistingFile(existing ? existing->file_id : std::string());
    }
    store_.insertPlan(f.file_id, placement);
    tx.commit();
  }

  try {
    for (const auto& loc : sources) {
      const int64_t i = loc.chunk.chunk_index;
      ExistingChunkSource source(chunks_, loc);
      writer_.write(f.file_id, i, source, targets.at(placement[static_cast<size_t>(i)].backend_id));
    }
  } catch (const std::exception& e) {
    spdlog::warn("fork of {} into {} failed, removing partial copy: {}", sourceFileId, f.file_id, e.what());
    store_.deleteFileHard(f.file_id);
    throw;
  }

  store_.incrementForkCount(sourceFileId);
  spdlog::info("file {} forked to {} as {}", sourceFileId, newOwnerId, f.file_id);
  return getFile(newOwnerId, f.file_id);
}

void FileCatalog::recordView(const std::string& fileId) {
  if (!store_.incrementViewCount(fileId)) {
    throw GatewayError(ErrorKind::FileNotFound, "file not found or not public: " + fileId);
  }
}

FileRecord FileCatalog::requireOwned(const std::string& ownerId, const std::string& fileId) {
  auto f = store_.findFile(fileId);
  if (!f || f->is_deleted || f->owner_id != ownerId) {
    throw GatewayError(ErrorKind::FileNotFound, "file not found: " + fileId);
  }
  return *f;
}

} // namespace rdg
