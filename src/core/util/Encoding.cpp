#include "Encoding.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cctype>
#include <ctime>
#include <vector>

#include "core/errors/GatewayError.hpp"

namespace rdg {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return to_hex(digest, len);
}

bool is_sha256_hex(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    if (std::isupper(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

std::string base64_encode(std::string_view bytes) {
  if (bytes.empty()) return {};
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                          reinterpret_cast<const unsigned char*>(bytes.data()),
                          static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::string base64_decode(std::string_view text) {
  std::string clean;
  clean.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) clean.push_back(c);
  }
  if (clean.empty()) return {};
  if (clean.size() % 4 != 0) {
    throw GatewayError(ErrorKind::InvalidRequest, "base64 payload has invalid length");
  }
  size_t padding = 0;
  if (clean[clean.size() - 1] == '=') ++padding;
  if (clean[clean.size() - 2] == '=') ++padding;

  std::string out(clean.size() / 4 * 3, '\0');
  int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                          reinterpret_cast<const unsigned char*>(clean.data()),
                          static_cast<int>(clean.size()));
  if (n < 0) {
    throw GatewayError(ErrorKind::InvalidRequest, "base64 payload is malformed");
  }
  // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

std::string uuid4() {
  unsigned char b[16];
  if (RAND_bytes(b, sizeof(b)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  // version 4
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
  // variant 10xx...
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);

  const std::string h = to_hex(b, sizeof(b));
  return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
         h.substr(16, 4) + "-" + h.substr(20, 12);
}

int64_t now_seconds() {
  return static_cast<int64_t>(std::time(nullptr));
}

std::string redact(const std::string& credential) {
  if (credential.size() <= 6) return "***";
  return credential.substr(0, 6) + "***";
}

} // namespace rdg
