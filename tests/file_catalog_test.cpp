#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "TestSupport.hpp"
#include "core/util/Encoding.hpp"

using namespace rdg;
using rdg_test::Gateway;
using rdg_test::Meta;

namespace {

UploadRequest RequestFor(const std::string& name, const std::string& payload) {
  UploadRequest r = Meta(name);
  r.size_bytes = static_cast<int64_t>(payload.size());
  r.content_hash = sha256_hex(payload);
  return r;
}

std::shared_ptr<const std::string> Piece(const std::string& payload, size_t index, size_t chunk) {
  return std::make_shared<const std::string>(payload.substr(index * chunk, chunk));
}

int TestInitValidation() {
  Gateway gw("catalog_validation", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  const std::string payload = rdg_test::RandomBytes(20, 1);

  UploadRequest r = RequestFor("", payload);
  CHECK_THROWS_KIND(gw.catalog.initUpload("alice", r), ErrorKind::InvalidRequest);
  r = RequestFor("a/b", payload);
  CHECK_THROWS_KIND(gw.catalog.initUpload("alice", r), ErrorKind::InvalidRequest);
  r = RequestFor("bad\r\nname.bin", payload);
  CHECK_THROWS_KIND(gw.catalog.initUpload("alice", r), ErrorKind::InvalidRequest);
  r = RequestFor("tab\tname.bin", payload);
  CHECK_THROWS_KIND(gw.catalog.initUpload("alice", r), ErrorKind::InvalidRequest);
  r = RequestFor("ok.bin", payload);
  r.size_bytes = 0;
  CHECK_THROWS_KIND(gw.catalog.initUpload("alice", r), ErrorKind::InvalidRequest);
  r = RequestFor("ok.bin", payload);
  r.content_hash = "abc";
  CHECK_THROWS_KIND(gw.catalog.initUpload("alice", r), ErrorKind::InvalidRequest);

  CHECK_THROWS_KIND(gw.catalog.initUpload("nobody", RequestFor("ok.bin", payload)),
                    ErrorKind::NoBackendAvailable);
  return 0;
}

int TestDedup() {
  Gateway gw("catalog_dedup", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  const std::string payload = rdg_test::RandomBytes(25, 2);

  FileRecord f = gw.catalog.storeObject("alice", Meta("one.bin"), payload);
  const int puts = gw.relay.putCalls;

  UploadPlan again = gw.catalog.initUpload("alice", RequestFor("copy.bin", payload));
  CHECK(again.duplicate);
  CHECK(again.file_id == f.file_id);
  CHECK(again.chunk_count == 3);
  CHECK(gw.relay.putCalls == puts);
  CHECK(gw.catalog.listFiles("alice", FileFilter{}).size() == 1);

  // Upper-case digests name the same content.
  UploadRequest upper = RequestFor("upper.bin", payload);
  for (auto& c : upper.content_hash) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  CHECK(gw.catalog.initUpload("alice", upper).duplicate);

  FileRecord same = gw.catalog.storeObject("alice", Meta("three.bin"), payload);
  CHECK(same.file_id == f.file_id);

  // Another owner is a separate dedup scope.
  gw.addBackend("bob", "tok-b", "-1002");
  CHECK(!gw.catalog.initUpload("bob", RequestFor("one.bin", payload)).duplicate);

  // Deleting frees the content hash.
  gw.catalog.deleteFile("alice", f.file_id);
  UploadPlan fresh = gw.catalog.initUpload("alice", RequestFor("one.bin", payload));
  CHECK(!fresh.duplicate);
  CHECK(fresh.file_id != f.file_id);
  return 0;
}

int TestPlanIsFixedAtInit() {
  Gateway gw("catalog_plan", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  gw.addBackend("alice", "tok-b", "-1002");
  const std::string payload = rdg_test::RandomBytes(40, 3);

  UploadPlan plan = gw.catalog.initUpload("alice", RequestFor("plan.bin", payload));
  CHECK(plan.chunk_count == 4);
  CHECK(plan.chunk_size == 10);
  CHECK(plan.placement.size() == 4);
  CHECK(plan.placement[0].backend_id != plan.placement[1].backend_id);
  CHECK(plan.placement[0].backend_id == plan.placement[2].backend_id);

  auto stored = gw.store.loadPlan(plan.file_id);
  CHECK(stored.size() == 4);
  for (size_t i = 0; i < 4; ++i) CHECK(stored[i].backend_id == plan.placement[i].backend_id);

  // A backend joining mid-upload does not move planned chunks.
  gw.addBackend("alice", "tok-c", "-1003");
  for (size_t i = 0; i < 4; ++i) {
    auto piece = Piece(payload, i, 10);
    ChunkRecord rec = gw.catalog.uploadChunk("alice", plan.file_id, static_cast<int64_t>(i),
                                             piece, sha256_hex(*piece));
    CHECK(rec.backend_id == plan.placement[i].backend_id);
  }
  gw.catalog.completeUpload("alice", plan.file_id);
  CHECK(gw.catalog.readRange("alice", plan.file_id, 0, 39) == payload);
  return 0;
}

int TestChunkValidation() {
  Gateway gw("catalog_chunk_validation", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  const std::string payload = rdg_test::RandomBytes(25, 4);
  UploadPlan plan = gw.catalog.initUpload("alice", RequestFor("v.bin", payload));

  auto p0 = Piece(payload, 0, 10);
  try {
    gw.catalog.uploadChunk("alice", plan.file_id, 3, p0, sha256_hex(*p0));
    return 1;
  } catch (const GatewayError& e) {
    CHECK(e.kind() == ErrorKind::InvalidChunkIndex);
    CHECK(e.chunkIndex() && *e.chunkIndex() == 3);
  }
  CHECK_THROWS_KIND(gw.catalog.uploadChunk("alice", plan.file_id, -1, p0, sha256_hex(*p0)),
                    ErrorKind::InvalidChunkIndex);

  // Last chunk must hold exactly the remainder.
  CHECK_THROWS_KIND(gw.catalog.uploadChunk("alice", plan.file_id, 2, p0, sha256_hex(*p0)),
                    ErrorKind::InvalidRequest);

  auto p1 = Piece(payload, 1, 10);
  CHECK_THROWS_KIND(gw.catalog.uploadChunk("alice", plan.file_id, 0, p0, sha256_hex(*p1)),
                    ErrorKind::ChunkHashMismatch);

  CHECK_THROWS_KIND(gw.catalog.uploadChunk("bob", plan.file_id, 0, p0, sha256_hex(*p0)),
                    ErrorKind::FileNotFound);
  CHECK(gw.relay.putCalls == 0);
  return 0;
}

int TestCompleteAndResume() {
  Gateway gw("catalog_complete", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  const std::string payload = rdg_test::RandomBytes(25, 5);
  UploadPlan plan = gw.catalog.initUpload("alice", RequestFor("resume.bin", payload));

  auto p2 = Piece(payload, 2, 10);
  gw.catalog.uploadChunk("alice", plan.file_id, 2, p2, sha256_hex(*p2));
  try {
    gw.catalog.completeUpload("alice", plan.file_id);
    return 1;
  } catch (const GatewayError& e) {
    CHECK(e.kind() == ErrorKind::IncompleteUpload);
    CHECK(*e.have() == 1 && *e.want() == 3);
  }
  CHECK_THROWS_KIND(gw.catalog.resolve("alice", plan.file_id), ErrorKind::IncompleteUpload);

  // Out of order, with one chunk sent twice.
  for (size_t i : {1u, 0u, 1u}) {
    auto p = Piece(payload, i, 10);
    gw.catalog.uploadChunk("alice", plan.file_id, static_cast<int64_t>(i), p, sha256_hex(*p));
  }
  CHECK(gw.store.countChunks(plan.file_id) == 3);
  FileRecord done = gw.catalog.completeUpload("alice", plan.file_id);
  CHECK(done.chunk_count == 3);
  CHECK(gw.catalog.readRange("alice", plan.file_id, 0, 24) == payload);
  return 0;
}

int TestPlannedBackendGone() {
  Gateway gw("catalog_planned_gone", 10);
  BackendRecord a = gw.addBackend("alice", "tok-a", "-1001");
  gw.addBackend("alice", "tok-b", "-1002");
  const std::string payload = rdg_test::RandomBytes(20, 6);
  UploadPlan plan = gw.catalog.initUpload("alice", RequestFor("gone.bin", payload));

  size_t onA = plan.placement[0].backend_id == a.backend_id ? 0 : 1;
  gw.pool.deactivateBackend("alice", a.backend_id);
  auto p = Piece(payload, onA, 10);
  CHECK_THROWS_KIND(gw.catalog.uploadChunk("alice", plan.file_id, static_cast<int64_t>(onA), p,
                                           sha256_hex(*p)),
                    ErrorKind::NoBackendAvailable);
  return 0;
}

int TestMetadataOperations() {
  Gateway gw("catalog_metadata", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  FileRecord doc = gw.catalog.storeObject("alice", Meta("report.pdf", "docs"), rdg_test::RandomBytes(12, 7));
  UploadRequest pic = Meta("cat.png", "/photos/");
  pic.mime_type = "image/png";
  FileRecord img = gw.catalog.storeObject("alice", pic, rdg_test::RandomBytes(30, 8));

  CHECK(doc.virtual_path == "/docs/report.pdf");
  CHECK(img.virtual_path == "/photos/cat.png");
  CHECK(virtualPathFor("", "a.txt") == "/a.txt");

  FileFilter images;
  images.mime_prefix = "image/";
  auto found = gw.catalog.listFiles("alice", images);
  CHECK(found.size() == 1 && found[0].file_id == img.file_id);

  FileFilter inDocs;
  inDocs.folder_prefix = "/docs";
  CHECK(gw.catalog.listFiles("alice", inDocs).size() == 1);

  FileFilter search;
  search.search = "repo";
  CHECK(gw.catalog.listFiles("alice", search).size() == 1);

  FileFilter bad;
  bad.limit = 0;
  CHECK_THROWS_KIND(gw.catalog.listFiles("alice", bad), ErrorKind::InvalidRequest);

  FileUpdate rename;
  rename.name = "final.pdf";
  FileRecord renamed = gw.catalog.updateFile("alice", doc.file_id, rename);
  CHECK(renamed.virtual_path == "/docs/final.pdf");

  FileUpdate move;
  move.folder = "archive/2024";
  move.is_public = true;
  move.public_title = "Final report";
  FileRecord moved = gw.catalog.updateFile("alice", doc.file_id, move);
  CHECK(moved.virtual_path == "/archive/2024/final.pdf");
  CHECK(moved.is_public);
  CHECK(gw.catalog.getFile("alice", doc.file_id).public_title == "Final report");

  FileFilter pub;
  pub.is_public = true;
  CHECK(gw.catalog.listFiles("alice", pub).size() == 1);

  // Public files resolve for other owners, private ones do not.
  CHECK(gw.catalog.resolve("bob", doc.file_id).file_id == doc.file_id);
  CHECK_THROWS_KIND(gw.catalog.resolve("bob", img.file_id), ErrorKind::FileNotFound);
  CHECK_THROWS_KIND(gw.catalog.getFile("bob", doc.file_id), ErrorKind::FileNotFound);

  gw.catalog.recordView(doc.file_id);
  gw.catalog.recordView(doc.file_id);
  CHECK(gw.catalog.getFile("alice", doc.file_id).view_count == 2);
  CHECK_THROWS_KIND(gw.catalog.recordView(img.file_id), ErrorKind::FileNotFound);

  gw.catalog.deleteFile("alice", img.file_id);
  CHECK_THROWS_KIND(gw.catalog.getFile("alice", img.file_id), ErrorKind::FileNotFound);
  CHECK_THROWS_KIND(gw.catalog.deleteFile("alice", img.file_id), ErrorKind::FileNotFound);
  CHECK(gw.catalog.listFiles("alice", FileFilter{}).size() == 1);
  // Soft delete keeps the chunk records.
  CHECK(gw.store.countChunks(img.file_id) == 3);
  return 0;
}

// Two clients start the same upload at once: one creates, the other joins it.
int TestConcurrentInitSameContent() {
  Gateway gw("catalog_race", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  const int rounds = 20;
  for (int round = 0; round < rounds; ++round) {
    const std::string payload = rdg_test::RandomBytes(25, 100 + static_cast<uint64_t>(round));
    UploadPlan plans[2];
    std::string failures[2];
    auto start = [&](int k) {
      try {
        plans[k] = gw.catalog.initUpload("alice", RequestFor("race" + std::to_string(k) + ".bin", payload));
      } catch (const std::exception& e) {
        failures[k] = e.what();
      }
    };
    std::thread first(start, 0);
    std::thread second(start, 1);
    first.join();
    second.join();

    CHECK(failures[0].empty() && failures[1].empty());
    CHECK(plans[0].duplicate != plans[1].duplicate);
    CHECK(plans[0].file_id == plans[1].file_id);
    CHECK(gw.store.loadPlan(plans[0].file_id).size() == 3);
  }
  CHECK(gw.catalog.listFiles("alice", FileFilter{}).size() == static_cast<size_t>(rounds));
  return 0;
}

int TestChunkSizeSurvivesRestart() {
  Gateway gw("catalog_restart", 10);
  gw.addBackend("alice", "tok-a", "-1001");
  const std::string payload = rdg_test::RandomBytes(25, 31);
  UploadPlan plan = gw.catalog.initUpload("alice", RequestFor("big.bin", payload));
  CHECK(plan.chunk_size == 10);
  CHECK(gw.store.findFile(plan.file_id)->chunk_size == 10);
  auto head = Piece(payload, 0, 10);
  gw.catalog.uploadChunk("alice", plan.file_id, 0, head, sha256_hex(*head));

  // The same catalog served again with a larger configured chunk size.
  ChunkStore chunks(gw.store, gw.relay, gw.repair, nullptr, 16);
  ChunkWriter writer(chunks);
  FileCatalog catalog(gw.store, gw.pool, chunks, writer);
  for (size_t i = 1; i < 3; ++i) {
    auto piece = Piece(payload, i, 10);
    catalog.uploadChunk("alice", plan.file_id, static_cast<int64_t>(i), piece, sha256_hex(*piece));
  }
  CHECK(catalog.completeUpload("alice", plan.file_id).chunk_count == 3);
  CHECK(catalog.readRange("alice", plan.file_id, 0, 24) == payload);

  UploadPlan again = catalog.initUpload("alice", RequestFor("again.bin", payload));
  CHECK(again.duplicate && again.chunk_size == 10);

  UploadPlan fresh = catalog.initUpload("alice", RequestFor("new.bin", rdg_test::RandomBytes(40, 32)));
  CHECK(fresh.chunk_size == 16 && fresh.chunk_count == 3);
  return 0;
}

// A catalog created before files carried their chunk size gains the column.
int TestSchemaUpgradeAddsChunkSize() {
  std::ifstream in(RDG_TEST_SCHEMA_PATH);
  CHECK(in.good());
  std::ostringstream old;
  std::string line;
  while (std::getline(in, line)) {
    if (line.find("chunk_size") == std::string::npos) old << line << "\n";
  }
  const auto dir = rdg_test::TempDir("rdg_catalog_upgrade");
  const std::string oldSchema = (dir / "old_schema.sql").string();
  {
    std::ofstream out(oldSchema);
    out << old.str();
  }
  const std::string db = (dir / "catalog.db").string();
  initDatabase(db, oldSchema);
  initDatabase(db, RDG_TEST_SCHEMA_PATH);
  initDatabase(db, RDG_TEST_SCHEMA_PATH);

  MetadataStore store(db);
  FileRecord f;
  f.file_id = "file_upgraded";
  f.owner_id = "alice";
  f.name = "a.bin";
  f.virtual_path = "/a.bin";
  f.size_bytes = 5;
  f.content_hash = sha256_hex("hello");
  f.chunk_count = 1;
  f.chunk_size = 8;
  CHECK(store.insertFile(f));
  CHECK(store.findFile("file_upgraded")->chunk_size == 8);
  return 0;
}

FileRecord PublishedFile(Gateway& gw, const std::string& payload) {
  FileRecord f = gw.catalog.storeObject("alice", Meta("shared.bin", "pub"), payload);
  FileUpdate pub;
  pub.is_public = true;
  return gw.catalog.updateFile("alice", f.file_id, pub);
}

int TestFork() {
  Gateway gw("catalog_fork", 10);
  gw.addBackend("alice", "alice-a", "-1001");
  gw.addBackend("alice", "alice-b", "-1002");
  gw.addBackend("alice", "alice-c", "-1003");
  gw.addBackend("bob", "bob-a", "-2001");
  gw.addBackend("bob", "bob-b", "-2002");

  const std::string payload = rdg_test::RandomBytes(25, 9);
  FileRecord src = PublishedFile(gw, payload);
  auto srcChunksBefore = gw.store.listChunks(src.file_id);

  FileRecord copy = gw.catalog.fork("bob", src.file_id);
  CHECK(copy.owner_id == "bob");
  CHECK(copy.file_id != src.file_id);
  CHECK(copy.forked_from_file == src.file_id);
  CHECK(copy.forked_from_owner == "alice");
  CHECK(!copy.is_public);
  CHECK(copy.virtual_path == src.virtual_path);

  auto bobPool = gw.pool.placementPool("bob");
  auto copyChunks = gw.store.listChunks(copy.file_id);
  CHECK(copyChunks.size() == 3);
  for (const auto& c : copyChunks) {
    CHECK(c.backend_id == bobPool[static_cast<size_t>(c.chunk_index % 2)].backend_id);
    CHECK(c.chunk_id != srcChunksBefore[static_cast<size_t>(c.chunk_index)].chunk_id);
  }

  auto srcChunksAfter = gw.store.listChunks(src.file_id);
  for (size_t i = 0; i < 3; ++i) {
    CHECK(srcChunksAfter[i].backend_id == srcChunksBefore[i].backend_id);
    CHECK(srcChunksAfter[i].remote_blob_ref == srcChunksBefore[i].remote_blob_ref);
  }
  CHECK(gw.catalog.readRange("bob", copy.file_id, 0, 24) == payload);
  CHECK(gw.catalog.getFile("alice", src.file_id).fork_count == 1);

  try {
    gw.catalog.fork("bob", src.file_id);
    return 1;
  } catch (const GatewayError& e) {
    CHECK(e.kind() == ErrorKind::DuplicateContent);
    CHECK(e.existingFileId() == copy.file_id);
  }
  CHECK_THROWS_KIND(gw.catalog.fork("alice", src.file_id), ErrorKind::InvalidRequest);

  FileUpdate rename;
  rename.name = "line\nbreak.bin";
  CHECK_THROWS_KIND(gw.catalog.updateFile("bob", copy.file_id, rename), ErrorKind::InvalidRequest);
  CHECK_THROWS_KIND(gw.catalog.fork("alice", copy.file_id), ErrorKind::FileNotFound);
  return 0;
}

// Two forks of the same file by one owner race: exactly one copy survives.
int TestConcurrentForks() {
  Gateway gw("catalog_fork_race", 10);
  gw.addBackend("alice", "alice-a", "-1001");
  gw.addBackend("bob", "bob-a", "-2001");
  FileRecord src = PublishedFile(gw, rdg_test::RandomBytes(25, 41));

  std::string forked[2];
  std::string duplicateOf[2];
  std::string failures[2];
  auto run = [&](int k) {
    try {
      forked[k] = gw.catalog.fork("bob", src.file_id).file_id;
    } catch (const GatewayError& e) {
      if (e.kind() == ErrorKind::DuplicateContent) {
        duplicateOf[k] = e.existingFileId();
      } else {
        failures[k] = e.what();
      }
    }
  };
  std::thread first(run, 0);
  std::thread second(run, 1);
  first.join();
  second.join();

  CHECK(failures[0].empty() && failures[1].empty());
  const int winner = forked[0].empty() ? 1 : 0;
  CHECK(!forked[winner].empty());
  CHECK(forked[1 - winner].empty());
  CHECK(duplicateOf[1 - winner] == forked[winner]);
  CHECK(gw.catalog.listFiles("bob", FileFilter{}).size() == 1);
  CHECK(gw.store.countChunks(forked[winner]) == 3);
  CHECK(gw.catalog.getFile("alice", src.file_id).fork_count == 1);
  return 0;
}

int TestFailedForkLeavesNothing() {
  Gateway gw("catalog_fork_rollback", 10);
  gw.addBackend("alice", "alice-a", "-1001");
  gw.addBackend("bob", "bob-a", "-2001");
  gw.addBackend("bob", "bob-b", "");   // no channel: chunk 0 or 1 cannot land

  const std::string payload = rdg_test::RandomBytes(25, 10);
  FileRecord src = PublishedFile(gw, payload);

  CHECK_THROWS_KIND(gw.catalog.fork("bob", src.file_id), ErrorKind::BackendChannelNotConfigured);
  CHECK(gw.catalog.listFiles("bob", FileFilter{}).empty());
  CHECK(gw.catalog.getFile("alice", src.file_id).fork_count == 0);
  CHECK(!gw.store.findLiveFileByHash("bob", src.content_hash));
  return 0;
}

}  // namespace

int main() {
  if (TestInitValidation() != 0) return 1;
  if (TestDedup() != 0) return 1;
  if (TestPlanIsFixedAtInit() != 0) return 1;
  if (TestChunkValidation() != 0) return 1;
  if (TestCompleteAndResume() != 0) return 1;
  if (TestPlannedBackendGone() != 0) return 1;
  if (TestMetadataOperations() != 0) return 1;
  if (TestConcurrentInitSameContent() != 0) return 1;
  if (TestChunkSizeSurvivesRestart() != 0) return 1;
  if (TestSchemaUpgradeAddsChunkSize() != 0) return 1;
  if (TestFork() != 0) return 1;
  if (TestConcurrentForks() != 0) return 1;
  if (TestFailedForkLeavesNothing() != 0) return 1;
  std::cout << "file_catalog_test passed\n";
  return 0;
}
