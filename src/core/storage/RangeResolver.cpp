#include "RangeResolver.hpp"

#include <algorithm>
#include <cctype>

#include "core/errors/GatewayError.hpp"

namespace rdg {

std::vector<ChunkSlice> resolveRange(const std::vector<int64_t>& chunkSizes,
                                     int64_t start, int64_t end) {
  std::vector<ChunkSlice> out;
  if (start > end) return out;

  int64_t offset = 0;
  for (size_t i = 0; i < chunkSizes.size(); ++i) {
    const int64_t size = chunkSizes[i];
    const int64_t chunkEnd = offset + size;   // exclusive
    if (offset > end) break;
    if (size > 0 && chunkEnd > start) {
      ChunkSlice s;
      s.position    = i;
      s.local_start = std::max<int64_t>(0, start - offset);
      s.local_end   = std::min<int64_t>(size - 1, end - offset);
      out.push_back(s);
    }
    offset = chunkEnd;
  }
  return out;
}

static bool parseDigits(const std::string& s, int64_t& out) {
  if (s.empty() || s.size() > 18) return false;
  int64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

static std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::optional<ByteRange> parseRangeHeader(const std::string& header, int64_t total) {
  const std::string h = trim(header);
  if (h.empty()) return std::nullopt;
  const std::string prefix = "bytes=";
  if (h.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

  const std::string rangeSet = trim(h.substr(prefix.size()));
  if (rangeSet.find(',') != std::string::npos) {
    throw GatewayError(ErrorKind::RangeNotSatisfiable, "multiple ranges are not supported");
  }
  const auto dash = rangeSet.find('-');
  if (dash == std::string::npos) return std::nullopt;

  const std::string first = trim(rangeSet.substr(0, dash));
  const std::string last  = trim(rangeSet.substr(dash + 1));

  ByteRange r;
  if (first.empty()) {
    // suffix form: last N bytes
    int64_t n = 0;
    if (!parseDigits(last, n)) return std::nullopt;
    if (n == 0 || total == 0) {
      throw GatewayError(ErrorKind::RangeNotSatisfiable, "empty suffix range");
    }
    r.start = std::max<int64_t>(0, total - n);
    r.end   = total - 1;
    return r;
  }

  if (!parseDigits(first, r.start)) return std::nullopt;
  if (last.empty()) {
    r.end = total - 1;
  } else {
    if (!parseDigits(last, r.end)) return std::nullopt;
    if (r.end < r.start) return std::nullopt;
    r.end = std::min(r.end, total - 1);
  }
  if (r.start >= total) {
    throw GatewayError(ErrorKind::RangeNotSatisfiable,
                       "range starts at " + std::to_string(r.start) + " beyond " +
                       std::to_string(total) + " bytes");
  }
  return r;
}

} // namespace rdg
