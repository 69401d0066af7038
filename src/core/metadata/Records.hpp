#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace rdg {

enum class HealthStatus { Healthy, RateLimited, Banned, Unknown };

const char* healthStatusName(HealthStatus s);
HealthStatus parseHealthStatus(const std::string& s);

// A relay credential plus the channel it stores chunks in.
struct BackendRecord {
  std::string  backend_id;
  std::string  owner_id;
  std::string  credential;
  std::string  remote_identity;
  std::string  display_name;
  std::string  remote_channel_id;   // empty until bound
  bool         is_active = true;
  HealthStatus health_status = HealthStatus::Unknown;
  int64_t      last_health_check = 0;
  int64_t      created_at = 0;
};

struct FileRecord {
  std::string file_id;
  std::string owner_id;
  std::string name;
  std::string virtual_path;
  int64_t     size_bytes = 0;
  std::string mime_type;
  std::string content_hash;
  int64_t     chunk_count = 0;
  int64_t     chunk_size = 0;
  bool        is_deleted = false;
  bool        is_public = false;
  std::string public_title;
  std::string public_category;
  std::string forked_from_file;
  std::string forked_from_owner;
  int64_t     view_count = 0;
  int64_t     fork_count = 0;
  int64_t     created_at = 0;
  int64_t     updated_at = 0;
};

struct ChunkRecord {
  std::string chunk_id;
  std::string file_id;
  int64_t     chunk_index = 0;
  int64_t     byte_size = 0;
  std::string content_hash;
  std::string backend_id;
  std::string remote_channel_id;    // channel the message was posted to
  std::string remote_message_ref;
  std::string remote_blob_ref;
  int64_t     created_at = 0;
};

struct PlacementEntry {
  int64_t     chunk_index = 0;
  std::string backend_id;
};

// A chunk joined with the backend currently holding it.
struct ChunkLocation {
  ChunkRecord   chunk;
  BackendRecord backend;

  bool readable() const {
    return backend.is_active && !backend.remote_channel_id.empty();
  }
};

struct FileFilter {
  std::string folder_prefix;
  std::string mime_prefix;
  std::string search;
  std::optional<bool> is_public;
  int64_t limit = 50;
  int64_t offset = 0;
};

} // namespace rdg
