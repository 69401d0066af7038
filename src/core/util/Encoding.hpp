#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace rdg {

std::string to_hex(const uint8_t* data, size_t len);

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(std::string_view bytes);

bool is_sha256_hex(std::string_view s);

std::string base64_encode(std::string_view bytes);
// Throws GatewayError(InvalidRequest) on malformed input.
std::string base64_decode(std::string_view text);

std::string uuid4();

int64_t now_seconds();

// Short, log-safe form of a relay credential.
std::string redact(const std::string& credential);

} // namespace rdg
