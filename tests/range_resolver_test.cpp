#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "core/storage/ChunkStore.hpp"
#include "core/storage/RangeResolver.hpp"

using namespace rdg;

namespace {

// Reassembles [start, end] from the chunked payload the way reads do.
std::string Gather(const std::vector<std::string_view>& chunks, int64_t start, int64_t end) {
  std::vector<int64_t> sizes;
  for (auto c : chunks) sizes.push_back(static_cast<int64_t>(c.size()));
  std::string out;
  for (const auto& s : resolveRange(sizes, start, end)) {
    out.append(chunks[s.position].substr(static_cast<size_t>(s.local_start),
                                         static_cast<size_t>(s.length())));
  }
  return out;
}

int TestChunkArithmetic() {
  CHECK(chunkCountFor(0, 10) == 0);
  CHECK(chunkCountFor(1, 10) == 1);
  CHECK(chunkCountFor(10, 10) == 1);
  CHECK(chunkCountFor(11, 10) == 2);

  const int64_t mib = 1024 * 1024;
  CHECK(chunkCountFor(45 * mib, 20 * mib) == 3);
  CHECK(expectedChunkLength(45 * mib, 20 * mib, 0) == 20 * mib);
  CHECK(expectedChunkLength(45 * mib, 20 * mib, 2) == 5 * mib);
  CHECK(expectedChunkLength(40 * mib, 20 * mib, 1) == 20 * mib);
  CHECK(expectedChunkLength(45 * mib, 20 * mib, 3) == 0);

  const std::string payload = rdg_test::RandomBytes(25, 1);
  auto pieces = splitIntoChunks(payload, 10);
  CHECK(pieces.size() == 3);
  CHECK(pieces[2].size() == 5);
  std::string joined;
  for (auto p : pieces) joined.append(p);
  CHECK(joined == payload);
  return 0;
}

int TestBoundaries() {
  const std::vector<int64_t> sizes = {10, 10, 5};

  auto whole = resolveRange(sizes, 0, 24);
  CHECK(whole.size() == 3);
  CHECK(whole[0].local_start == 0 && whole[0].local_end == 9);
  CHECK(whole[2].local_start == 0 && whole[2].local_end == 4);

  auto edge = resolveRange(sizes, 10, 10);
  CHECK(edge.size() == 1);
  CHECK(edge[0].position == 1 && edge[0].local_start == 0 && edge[0].local_end == 0);

  auto straddle = resolveRange(sizes, 9, 10);
  CHECK(straddle.size() == 2);
  CHECK(straddle[0].position == 0 && straddle[0].local_start == 9);
  CHECK(straddle[1].position == 1 && straddle[1].local_end == 0);

  auto tail = resolveRange(sizes, 24, 24);
  CHECK(tail.size() == 1 && tail[0].position == 2 && tail[0].local_start == 4);

  CHECK(resolveRange(sizes, 5, 4).empty());
  return 0;
}

int TestRandomRanges() {
  std::mt19937_64 rng(42);
  for (int round = 0; round < 300; ++round) {
    const size_t len = 1 + rng() % 500;
    const int64_t chunk = 1 + static_cast<int64_t>(rng() % 64);
    const std::string payload = rdg_test::RandomBytes(len, rng());
    auto pieces = splitIntoChunks(payload, chunk);

    int64_t start = static_cast<int64_t>(rng() % len);
    int64_t end = static_cast<int64_t>(rng() % len);
    if (start > end) std::swap(start, end);
    if (Gather(pieces, start, end) != payload.substr(static_cast<size_t>(start),
                                                     static_cast<size_t>(end - start + 1))) {
      std::cerr << "len=" << len << " chunk=" << chunk << " range=" << start << "-" << end << "\n";
      return 1;
    }
  }
  return 0;
}

int TestRangeHeader() {
  const int64_t total = 47185920;

  auto r = parseRangeHeader("bytes=19000000-21000000", total);
  CHECK(r && r->start == 19000000 && r->end == 21000000);
  CHECK(r->length() == 2000001);

  auto open = parseRangeHeader("bytes=100-", 1000);
  CHECK(open && open->start == 100 && open->end == 999);

  auto suffix = parseRangeHeader("bytes=-10", 1000);
  CHECK(suffix && suffix->start == 990 && suffix->end == 999);

  auto clamped = parseRangeHeader("bytes=900-5000", 1000);
  CHECK(clamped && clamped->end == 999);

  CHECK(!parseRangeHeader("", 1000));
  CHECK(!parseRangeHeader("items=0-5", 1000));

  CHECK_THROWS_KIND(parseRangeHeader("bytes=0-1,5-6", 1000), ErrorKind::RangeNotSatisfiable);
  CHECK_THROWS_KIND(parseRangeHeader("bytes=1000-1001", 1000), ErrorKind::RangeNotSatisfiable);
  return 0;
}

}  // namespace

int main() {
  if (TestChunkArithmetic() != 0) return 1;
  if (TestBoundaries() != 0) return 1;
  if (TestRandomRanges() != 0) return 1;
  if (TestRangeHeader() != 0) return 1;
  std::cout << "range_resolver_test passed\n";
  return 0;
}
