#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Records.hpp"

struct sqlite3;

namespace rdg {

// Owns the catalog connection. Every method is safe to call from concurrent
// request threads; a Transaction holds the connection for its whole scope.
class MetadataStore {
public:
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore();

  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;

  class Transaction {
  public:
    explicit Transaction(MetadataStore& store);
    ~Transaction();
    void commit();
  private:
    MetadataStore& store_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool done_ = false;
  };

  // --- backends ---
  void insertBackend(const BackendRecord& b);
  std::optional<BackendRecord> findBackend(const std::string& backend_id);
  std::optional<BackendRecord> findBackendByIdentity(const std::string& owner_id,
                                                     const std::string& remote_identity);
  std::vector<BackendRecord> listActiveBackends(const std::string& owner_id);
  std::vector<BackendRecord> listAllActiveBackends();
  // Active and healthy, most recently checked first.
  std::vector<BackendRecord> healthyPool(const std::string& owner_id);
  void updateBackendHealth(const std::string& backend_id, HealthStatus status, int64_t at);
  bool setBackendChannel(const std::string& backend_id, const std::string& channel_id);
  bool setBackendActive(const std::string& backend_id, bool active);
  void reactivateBackend(const std::string& backend_id, const std::string& credential,
                         const std::string& display_name, int64_t at);

  // --- files ---
  // Returns false when the live (owner, content_hash) uniqueness constraint
  // rejects the row.
  bool insertFile(const FileRecord& f);
  std::optional<FileRecord> findFile(const std::string& file_id);
  std::optional<FileRecord> findLiveFileByHash(const std::string& owner_id,
                                               const std::string& content_hash);
  std::vector<FileRecord> listFiles(const std::string& owner_id, const FileFilter& filter);
  void updateFileMeta(const FileRecord& f);
  bool softDeleteFile(const std::string& file_id, int64_t at);
  void touchFile(const std::string& file_id, int64_t at);
  void incrementForkCount(const std::string& file_id);
  bool incrementViewCount(const std::string& file_id);
  // Removes the file row with its plan and chunk rows.
  void deleteFileHard(const std::string& file_id);

  // --- placement plan ---
  void insertPlan(const std::string& file_id, const std::vector<PlacementEntry>& plan);
  std::optional<std::string> plannedBackend(const std::string& file_id, int64_t chunk_index);
  std::vector<PlacementEntry> loadPlan(const std::string& file_id);

  // --- chunks ---
  // Creates or replaces the record for (file_id, chunk_index).
  void upsertChunk(const ChunkRecord& c);
  int64_t countChunks(const std::string& file_id);
  std::vector<ChunkRecord> listChunks(const std::string& file_id);
  std::vector<ChunkLocation> chunkLocations(const std::string& file_id);
  bool updateChunkBlobRef(const std::string& chunk_id, const std::string& blob_ref);

private:
  void exec(const char* sql);

  sqlite3* db_;
  std::recursive_mutex mu_;
};

} // namespace rdg
