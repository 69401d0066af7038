#include "MetadataStore.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/errors/GatewayError.hpp"

namespace rdg {

const char* healthStatusName(HealthStatus s) {
  switch (s) {
    case HealthStatus::Healthy:     return "healthy";
    case HealthStatus::RateLimited: return "rate_limited";
    case HealthStatus::Banned:      return "banned";
    case HealthStatus::Unknown:     return "unknown";
  }
  return "unknown";
}

HealthStatus parseHealthStatus(const std::string& s) {
  if (s == "healthy") return HealthStatus::Healthy;
  if (s == "rate_limited") return HealthStatus::RateLimited;
  if (s == "banned") return HealthStatus::Banned;
  return HealthStatus::Unknown;
}

namespace {

// Prepared statement scoped to one call.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      fail("prepare");
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bindText(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  // Empty strings are stored as NULL.
  Statement& bindTextOrNull(int i, const std::string& v) {
    if (v.empty()) sqlite3_bind_null(st_, i);
    else sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Statement& bindInt(int i, int64_t v) {
    sqlite3_bind_int64(st_, i, v);
    return *this;
  }

  // true while rows are available
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    fail("step");
  }

  int stepRaw() { return sqlite3_step(st_); }

  std::string text(int col) const {
    const unsigned char* p = sqlite3_column_text(st_, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
  }
  int64_t integer(int col) const { return sqlite3_column_int64(st_, col); }

  [[noreturn]] void fail(const char* what) const {
    throw GatewayError(ErrorKind::StorageFailure,
                       std::string("sqlite ") + what + " failed: " + sqlite3_errmsg(db_));
  }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

constexpr const char* kBackendCols =
  "backend_id, owner_id, credential, remote_identity, display_name, remote_channel_id, "
  "is_active, health_status, last_health_check, created_at";

constexpr const char* kFileCols =
  "file_id, owner_id, name, virtual_path, size_bytes, mime_type, content_hash, chunk_count, "
  "is_deleted, is_public, public_title, public_category, forked_from_file, forked_from_owner, "
  "view_count, fork_count, created_at, updated_at, chunk_size";

constexpr const char* kChunkCols =
  "chunk_id, file_id, chunk_index, byte_size, content_hash, backend_id, remote_channel_id, "
  "remote_message_ref, remote_blob_ref, created_at";

BackendRecord readBackend(const Statement& st, int c) {
  BackendRecord b;
  b.backend_id        = st.text(c + 0);
  b.owner_id          = st.text(c + 1);
  b.credential        = st.text(c + 2);
  b.remote_identity   = st.text(c + 3);
  b.display_name      = st.text(c + 4);
  b.remote_channel_id = st.text(c + 5);
  b.is_active         = st.integer(c + 6) != 0;
  b.health_status     = parseHealthStatus(st.text(c + 7));
  b.last_health_check = st.integer(c + 8);
  b.created_at        = st.integer(c + 9);
  return b;
}

FileRecord readFile(const Statement& st) {
  FileRecord f;
  f.file_id           = st.text(0);
  f.owner_id          = st.text(1);
  f.name              = st.text(2);
  f.virtual_path      = st.text(3);
  f.size_bytes        = st.integer(4);
  f.mime_type         = st.text(5);
  f.content_hash      = st.text(6);
  f.chunk_count       = st.integer(7);
  f.is_deleted        = st.integer(8) != 0;
  f.is_public         = st.integer(9) != 0;
  f.public_title      = st.text(10);
  f.public_category   = st.text(11);
  f.forked_from_file  = st.text(12);
  f.forked_from_owner = st.text(13);
  f.view_count        = st.integer(14);
  f.fork_count        = st.integer(15);
  f.created_at        = st.integer(16);
  f.updated_at        = st.integer(17);
  f.chunk_size        = st.integer(18);
  return f;
}

ChunkRecord readChunk(const Statement& st, int c) {
  ChunkRecord r;
  r.chunk_id           = st.text(c + 0);
  r.file_id            = st.text(c + 1);
  r.chunk_index        = st.integer(c + 2);
  r.byte_size          = st.integer(c + 3);
  r.content_hash       = st.text(c + 4);
  r.backend_id         = st.text(c + 5);
  r.remote_channel_id  = st.text(c + 6);
  r.remote_message_ref = st.text(c + 7);
  r.remote_blob_ref    = st.text(c + 8);
  r.created_at         = st.integer(c + 9);
  return r;
}

std::string escapeLike(const std::string& s) {
  std::string out;
  for (char ch : s) {
    if (ch == '%' || ch == '_' || ch == '\\') out.push_back('\\');
    out.push_back(ch);
  }
  return out;
}

} // namespace

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw GatewayError(ErrorKind::StorageFailure, "failed to open db " + dbPath + ": " + msg);
  }
  db_ = db;
  exec("PRAGMA foreign_keys=ON;");
  exec("PRAGMA busy_timeout=5000;");
}

MetadataStore::~MetadataStore() {
  if (db_) sqlite3_close(db_);
}

void MetadataStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw GatewayError(ErrorKind::StorageFailure, std::string("sqlite exec failed: ") + msg);
  }
}

// ---------------- Transaction ----------------

MetadataStore::Transaction::Transaction(MetadataStore& store)
  : store_(store), lock_(store.mu_) {
  store_.exec("BEGIN IMMEDIATE;");
}

MetadataStore::Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(store_.db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("rollback failed: {}", err ? err : "unknown error");
  }
  sqlite3_free(err);
}

void MetadataStore::Transaction::commit() {
  store_.exec("COMMIT;");
  done_ = true;
}

// ---------------- backends ----------------

void MetadataStore::insertBackend(const BackendRecord& b) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, R"SQL(
    INSERT INTO backends
      (backend_id, owner_id, credential, remote_identity, display_name, remote_channel_id,
       is_active, health_status, last_health_check, created_at)
    VALUES (?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bindText(i++, b.backend_id)
    .bindText(i++, b.owner_id)
    .bindText(i++, b.credential)
    .bindText(i++, b.remote_identity)
    .bindTextOrNull(i++, b.display_name)
    .bindTextOrNull(i++, b.remote_channel_id)
    .bindInt(i++, b.is_active ? 1 : 0)
    .bindText(i++, healthStatusName(b.health_status))
    .bindInt(i++, b.last_health_check)
    .bindInt(i++, b.created_at);
  st.step();
}

std::optional<BackendRecord> MetadataStore::findBackend(const std::string& backend_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kBackendCols + " FROM backends WHERE backend_id = ?";
  Statement st(db_, sql.c_str());
  st.bindText(1, backend_id);
  if (!st.step()) return std::nullopt;
  return readBackend(st, 0);
}

std::optional<BackendRecord> MetadataStore::findBackendByIdentity(const std::string& owner_id,
                                                                  const std::string& remote_identity) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kBackendCols +
    " FROM backends WHERE owner_id = ? AND remote_identity = ? ORDER BY is_active DESC LIMIT 1";
  Statement st(db_, sql.c_str());
  st.bindText(1, owner_id).bindText(2, remote_identity);
  if (!st.step()) return std::nullopt;
  return readBackend(st, 0);
}

std::vector<BackendRecord> MetadataStore::listActiveBackends(const std::string& owner_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kBackendCols +
    " FROM backends WHERE owner_id = ? AND is_active = 1 ORDER BY created_at DESC, backend_id";
  Statement st(db_, sql.c_str());
  st.bindText(1, owner_id);
  std::vector<BackendRecord> out;
  while (st.step()) out.push_back(readBackend(st, 0));
  return out;
}

std::vector<BackendRecord> MetadataStore::listAllActiveBackends() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kBackendCols +
    " FROM backends WHERE is_active = 1 ORDER BY backend_id";
  Statement st(db_, sql.c_str());
  std::vector<BackendRecord> out;
  while (st.step()) out.push_back(readBackend(st, 0));
  return out;
}

std::vector<BackendRecord> MetadataStore::healthyPool(const std::string& owner_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kBackendCols +
    " FROM backends WHERE owner_id = ? AND is_active = 1 AND health_status = 'healthy'"
    " ORDER BY last_health_check DESC, created_at ASC, backend_id ASC";
  Statement st(db_, sql.c_str());
  st.bindText(1, owner_id);
  std::vector<BackendRecord> out;
  while (st.step()) out.push_back(readBackend(st, 0));
  return out;
}

void MetadataStore::updateBackendHealth(const std::string& backend_id, HealthStatus status, int64_t at) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE backends SET health_status = ?, last_health_check = ? WHERE backend_id = ?");
  st.bindText(1, healthStatusName(status)).bindInt(2, at).bindText(3, backend_id);
  st.step();
}

bool MetadataStore::setBackendChannel(const std::string& backend_id, const std::string& channel_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE backends SET remote_channel_id = ? WHERE backend_id = ?");
  st.bindTextOrNull(1, channel_id).bindText(2, backend_id);
  st.step();
  return sqlite3_changes(db_) > 0;
}

bool MetadataStore::setBackendActive(const std::string& backend_id, bool active) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE backends SET is_active = ? WHERE backend_id = ? AND is_active <> ?");
  st.bindInt(1, active ? 1 : 0).bindText(2, backend_id).bindInt(3, active ? 1 : 0);
  st.step();
  return sqlite3_changes(db_) > 0;
}

void MetadataStore::reactivateBackend(const std::string& backend_id, const std::string& credential,
                                      const std::string& display_name, int64_t at) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, R"SQL(
    UPDATE backends
       SET is_active = 1, credential = ?, display_name = ?,
           health_status = 'healthy', last_health_check = ?
     WHERE backend_id = ?
  )SQL");
  st.bindText(1, credential).bindTextOrNull(2, display_name).bindInt(3, at).bindText(4, backend_id);
  st.step();
}

// ---------------- files ----------------

bool MetadataStore::insertFile(const FileRecord& f) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, R"SQL(
    INSERT INTO files
      (file_id, owner_id, name, virtual_path, size_bytes, mime_type, content_hash, chunk_count,
       is_deleted, is_public, public_title, public_category, forked_from_file, forked_from_owner,
       view_count, fork_count, created_at, updated_at, chunk_size)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bindText(i++, f.file_id)
    .bindText(i++, f.owner_id)
    .bindText(i++, f.name)
    .bindText(i++, f.virtual_path)
    .bindInt(i++, f.size_bytes)
    .bindTextOrNull(i++, f.mime_type)
    .bindText(i++, f.content_hash)
    .bindInt(i++, f.chunk_count)
    .bindInt(i++, f.is_deleted ? 1 : 0)
    .bindInt(i++, f.is_public ? 1 : 0)
    .bindTextOrNull(i++, f.public_title)
    .bindTextOrNull(i++, f.public_category)
    .bindTextOrNull(i++, f.forked_from_file)
    .bindTextOrNull(i++, f.forked_from_owner)
    .bindInt(i++, f.view_count)
    .bindInt(i++, f.fork_count)
    .bindInt(i++, f.created_at)
    .bindInt(i++, f.updated_at)
    .bindInt(i++, f.chunk_size);

  int rc = st.stepRaw();
  if (rc == SQLITE_DONE) return true;
  if (sqlite3_extended_errcode(db_) == SQLITE_CONSTRAINT_UNIQUE) {
    spdlog::debug("insertFile: live content hash conflict for owner {}", f.owner_id);
    return false;
  }
  st.fail("insertFile");
}

std::optional<FileRecord> MetadataStore::findFile(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kFileCols + " FROM files WHERE file_id = ?";
  Statement st(db_, sql.c_str());
  st.bindText(1, file_id);
  if (!st.step()) return std::nullopt;
  return readFile(st);
}

std::optional<FileRecord> MetadataStore::findLiveFileByHash(const std::string& owner_id,
                                                            const std::string& content_hash) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kFileCols +
    " FROM files WHERE owner_id = ? AND content_hash = ? AND is_deleted = 0 LIMIT 1";
  Statement st(db_, sql.c_str());
  st.bindText(1, owner_id).bindText(2, content_hash);
  if (!st.step()) return std::nullopt;
  return readFile(st);
}

std::vector<FileRecord> MetadataStore::listFiles(const std::string& owner_id, const FileFilter& filter) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  std::string sql = std::string("SELECT ") + kFileCols + " FROM files WHERE owner_id = ? AND is_deleted = 0";
  std::vector<std::string> textParams;
  if (!filter.folder_prefix.empty()) {
    sql += " AND virtual_path LIKE ? ESCAPE '\\'";
    textParams.push_back(escapeLike(filter.folder_prefix) + "%");
  }
  if (!filter.mime_prefix.empty()) {
    sql += " AND mime_type LIKE ? ESCAPE '\\'";
    textParams.push_back(escapeLike(filter.mime_prefix) + "%");
  }
  if (!filter.search.empty()) {
    sql += " AND (name LIKE ? ESCAPE '\\' OR virtual_path LIKE ? ESCAPE '\\')";
    const std::string term = "%" + escapeLike(filter.search) + "%";
    textParams.push_back(term);
    textParams.push_back(term);
  }
  if (filter.is_public) {
    sql += *filter.is_public ? " AND is_public = 1" : " AND is_public = 0";
  }
  sql += " ORDER BY created_at DESC, file_id LIMIT ? OFFSET ?";

  Statement st(db_, sql.c_str());
  int i = 1;
  st.bindText(i++, owner_id);
  for (const auto& p : textParams) st.bindText(i++, p);
  st.bindInt(i++, filter.limit).bindInt(i++, filter.offset);

  std::vector<FileRecord> out;
  while (st.step()) out.push_back(readFile(st));
  return out;
}

void MetadataStore::updateFileMeta(const FileRecord& f) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, R"SQL(
    UPDATE files
       SET name = ?, virtual_path = ?, is_public = ?, public_title = ?, public_category = ?,
           updated_at = ?
     WHERE file_id = ?
  )SQL");
  st.bindText(1, f.name)
    .bindText(2, f.virtual_path)
    .bindInt(3, f.is_public ? 1 : 0)
    .bindTextOrNull(4, f.public_title)
    .bindTextOrNull(5, f.public_category)
    .bindInt(6, f.updated_at)
    .bindText(7, f.file_id);
  st.step();
}

bool MetadataStore::softDeleteFile(const std::string& file_id, int64_t at) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE files SET is_deleted = 1, updated_at = ? WHERE file_id = ? AND is_deleted = 0");
  st.bindInt(1, at).bindText(2, file_id);
  st.step();
  return sqlite3_changes(db_) > 0;
}

void MetadataStore::touchFile(const std::string& file_id, int64_t at) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE files SET updated_at = ? WHERE file_id = ?");
  st.bindInt(1, at).bindText(2, file_id);
  st.step();
}

void MetadataStore::incrementForkCount(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE files SET fork_count = fork_count + 1 WHERE file_id = ?");
  st.bindText(1, file_id);
  st.step();
}

bool MetadataStore::incrementViewCount(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE files SET view_count = view_count + 1 "
                    "WHERE file_id = ? AND is_public = 1 AND is_deleted = 0");
  st.bindText(1, file_id);
  st.step();
  return sqlite3_changes(db_) > 0;
}

void MetadataStore::deleteFileHard(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  {
    Statement st(db_, "DELETE FROM chunks WHERE file_id = ?");
    st.bindText(1, file_id);
    st.step();
  }
  {
    Statement st(db_, "DELETE FROM chunk_plan WHERE file_id = ?");
    st.bindText(1, file_id);
    st.step();
  }
  Statement st(db_, "DELETE FROM files WHERE file_id = ?");
  st.bindText(1, file_id);
  st.step();
}

// ---------------- placement plan ----------------

void MetadataStore::insertPlan(const std::string& file_id, const std::vector<PlacementEntry>& plan) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  for (const auto& e : plan) {
    Statement st(db_, "INSERT INTO chunk_plan (file_id, chunk_index, backend_id) VALUES (?,?,?)");
    st.bindText(1, file_id).bindInt(2, e.chunk_index).bindText(3, e.backend_id);
    st.step();
  }
}

std::optional<std::string> MetadataStore::plannedBackend(const std::string& file_id, int64_t chunk_index) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "SELECT backend_id FROM chunk_plan WHERE file_id = ? AND chunk_index = ?");
  st.bindText(1, file_id).bindInt(2, chunk_index);
  if (!st.step()) return std::nullopt;
  return st.text(0);
}

std::vector<PlacementEntry> MetadataStore::loadPlan(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "SELECT chunk_index, backend_id FROM chunk_plan WHERE file_id = ? ORDER BY chunk_index");
  st.bindText(1, file_id);
  std::vector<PlacementEntry> out;
  while (st.step()) out.push_back(PlacementEntry{st.integer(0), st.text(1)});
  return out;
}

// ---------------- chunks ----------------

void MetadataStore::upsertChunk(const ChunkRecord& c) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, R"SQL(
    INSERT INTO chunks
      (chunk_id, file_id, chunk_index, byte_size, content_hash, backend_id, remote_channel_id,
       remote_message_ref, remote_blob_ref, created_at)
    VALUES (?,?,?,?,?,?,?,?,?,?)
    ON CONFLICT(file_id, chunk_index) DO UPDATE SET
      byte_size = excluded.byte_size,
      content_hash = excluded.content_hash,
      backend_id = excluded.backend_id,
      remote_channel_id = excluded.remote_channel_id,
      remote_message_ref = excluded.remote_message_ref,
      remote_blob_ref = excluded.remote_blob_ref
  )SQL");
  int i = 1;
  st.bindText(i++, c.chunk_id)
    .bindText(i++, c.file_id)
    .bindInt(i++, c.chunk_index)
    .bindInt(i++, c.byte_size)
    .bindText(i++, c.content_hash)
    .bindText(i++, c.backend_id)
    .bindText(i++, c.remote_channel_id)
    .bindText(i++, c.remote_message_ref)
    .bindText(i++, c.remote_blob_ref)
    .bindInt(i++, c.created_at);
  st.step();
}

int64_t MetadataStore::countChunks(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "SELECT COUNT(*) FROM chunks WHERE file_id = ?");
  st.bindText(1, file_id);
  return st.step() ? st.integer(0) : 0;
}

std::vector<ChunkRecord> MetadataStore::listChunks(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kChunkCols +
    " FROM chunks WHERE file_id = ? ORDER BY chunk_index";
  Statement st(db_, sql.c_str());
  st.bindText(1, file_id);
  std::vector<ChunkRecord> out;
  while (st.step()) out.push_back(readChunk(st, 0));
  return out;
}

std::vector<ChunkLocation> MetadataStore::chunkLocations(const std::string& file_id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  const char* sql = R"SQL(
    SELECT c.chunk_id, c.file_id, c.chunk_index, c.byte_size, c.content_hash, c.backend_id,
           c.remote_channel_id, c.remote_message_ref, c.remote_blob_ref, c.created_at,
           b.backend_id, b.owner_id, b.credential, b.remote_identity, b.display_name,
           b.remote_channel_id, b.is_active, b.health_status, b.last_health_check, b.created_at
      FROM chunks c
      JOIN backends b ON c.backend_id = b.backend_id
     WHERE c.file_id = ?
     ORDER BY c.chunk_index ASC
  )SQL";
  Statement st(db_, sql);
  st.bindText(1, file_id);
  std::vector<ChunkLocation> out;
  while (st.step()) out.push_back(ChunkLocation{readChunk(st, 0), readBackend(st, 10)});
  return out;
}

bool MetadataStore::updateChunkBlobRef(const std::string& chunk_id, const std::string& blob_ref) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Statement st(db_, "UPDATE chunks SET remote_blob_ref = ? WHERE chunk_id = ?");
  st.bindText(1, blob_ref).bindText(2, chunk_id);
  st.step();
  return sqlite3_changes(db_) > 0;
}

} // namespace rdg
