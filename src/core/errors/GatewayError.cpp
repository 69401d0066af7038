#include "GatewayError.hpp"

namespace rdg {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DuplicateContent:            return "DuplicateContent";
    case ErrorKind::NoBackendAvailable:          return "NoBackendAvailable";
    case ErrorKind::BackendChannelNotConfigured: return "BackendChannelNotConfigured";
    case ErrorKind::InvalidCredential:           return "InvalidCredential";
    case ErrorKind::RateLimited:                 return "RateLimited";
    case ErrorKind::BlobNotFound:                return "BlobNotFound";
    case ErrorKind::TransportUnavailable:        return "TransportUnavailable";
    case ErrorKind::RepairFailed:                return "RepairFailed";
    case ErrorKind::ChunksUnavailable:           return "ChunksUnavailable";
    case ErrorKind::ChunkFetchFailed:            return "ChunkFetchFailed";
    case ErrorKind::IncompleteUpload:            return "IncompleteUpload";
    case ErrorKind::InvalidChunkIndex:           return "InvalidChunkIndex";
    case ErrorKind::ChunkHashMismatch:           return "ChunkHashMismatch";
    case ErrorKind::InvalidRequest:              return "InvalidRequest";
    case ErrorKind::FileNotFound:                return "FileNotFound";
    case ErrorKind::BackendNotFound:             return "BackendNotFound";
    case ErrorKind::RangeNotSatisfiable:         return "RangeNotSatisfiable";
    case ErrorKind::Unauthorized:                return "Unauthorized";
    case ErrorKind::ConfigError:                 return "ConfigError";
    case ErrorKind::StorageFailure:              return "StorageFailure";
  }
  return "Unknown";
}

int httpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DuplicateContent:            return 409;
    case ErrorKind::InvalidRequest:
    case ErrorKind::InvalidChunkIndex:
    case ErrorKind::ChunkHashMismatch:
    case ErrorKind::IncompleteUpload:
    case ErrorKind::NoBackendAvailable:
    case ErrorKind::BackendChannelNotConfigured: return 400;
    case ErrorKind::Unauthorized:                return 401;
    case ErrorKind::FileNotFound:
    case ErrorKind::BackendNotFound:             return 404;
    case ErrorKind::RangeNotSatisfiable:         return 416;
    case ErrorKind::RateLimited:                 return 429;
    case ErrorKind::InvalidCredential:
    case ErrorKind::BlobNotFound:
    case ErrorKind::RepairFailed:
    case ErrorKind::ChunkFetchFailed:
    case ErrorKind::TransportUnavailable:        return 502;
    case ErrorKind::ChunksUnavailable:           return 503;
    case ErrorKind::ConfigError:
    case ErrorKind::StorageFailure:              return 500;
  }
  return 500;
}

} // namespace rdg
