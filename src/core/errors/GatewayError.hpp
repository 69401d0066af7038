#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace rdg {

// Stable, machine-readable failure kinds. The name of each kind is what the
// HTTP layer reports in the "error" field.
enum class ErrorKind {
  DuplicateContent,
  NoBackendAvailable,
  BackendChannelNotConfigured,
  InvalidCredential,
  RateLimited,
  BlobNotFound,
  TransportUnavailable,
  RepairFailed,
  ChunksUnavailable,
  ChunkFetchFailed,
  IncompleteUpload,
  InvalidChunkIndex,
  ChunkHashMismatch,
  InvalidRequest,
  FileNotFound,
  BackendNotFound,
  RangeNotSatisfiable,
  Unauthorized,
  ConfigError,
  StorageFailure
};

const char* errorKindName(ErrorKind kind);
int httpStatusFor(ErrorKind kind);

class GatewayError : public std::runtime_error {
public:
  GatewayError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

  std::optional<int64_t> chunkIndex() const { return chunkIndex_; }
  GatewayError& withChunkIndex(int64_t index) { chunkIndex_ = index; return *this; }

  // have/want counts for IncompleteUpload
  std::optional<int64_t> have() const { return have_; }
  std::optional<int64_t> want() const { return want_; }
  GatewayError& withCounts(int64_t have, int64_t want) {
    have_ = have;
    want_ = want;
    return *this;
  }

  // Set for DuplicateContent: the file that already holds the content.
  const std::string& existingFileId() const { return existingFileId_; }
  GatewayError& withExistingFile(std::string fileId) {
    existingFileId_ = std::move(fileId);
    return *this;
  }

private:
  ErrorKind kind_;
  std::optional<int64_t> chunkIndex_;
  std::optional<int64_t> have_;
  std::optional<int64_t> want_;
  std::string existingFileId_;
};

} // namespace rdg
