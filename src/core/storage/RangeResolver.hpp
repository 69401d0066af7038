#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdg {

// Part of one chunk needed for a byte range. `position` indexes the chunk
// size list handed to resolveRange; local offsets are inclusive.
struct ChunkSlice {
  size_t  position = 0;
  int64_t local_start = 0;
  int64_t local_end = 0;

  int64_t length() const { return local_end - local_start + 1; }
};

// Inclusive global byte range.
struct ByteRange {
  int64_t start = 0;
  int64_t end = 0;

  int64_t length() const { return end - start + 1; }
};

// Walks the ordered chunk sizes and returns, in order, the slice of every
// chunk overlapping [start, end]. Pure; empty when start > end.
std::vector<ChunkSlice> resolveRange(const std::vector<int64_t>& chunkSizes,
                                     int64_t start, int64_t end);

// Parses a single "bytes=" range against a body of `total` bytes.
// nullopt: no header, or a header that is not a byte range (serve the whole
// body). Throws GatewayError(RangeNotSatisfiable) for more than one range or
// for a range that does not overlap the body.
std::optional<ByteRange> parseRangeHeader(const std::string& header, int64_t total);

} // namespace rdg
