#pragma once
#include <cstdint>
#include <string>

namespace rdg {

// Upper bound the relay imposes on a single downloadable blob.
constexpr int64_t kMaxChunkSize = 20LL * 1024 * 1024;

struct GatewayConfig {
  std::string db_path         = "data/relay-drive.db";
  std::string schema_path;    // empty: search the usual locations
  std::string bind_address    = "0.0.0.0";
  int         port            = 8080;
  std::string api_key;        // empty = shared key check disabled
  int64_t     chunk_size      = kMaxChunkSize;
  int64_t     rate_limit_ms   = 3000;
  std::string relay_base_url  = "https://api.telegram.org";
  int64_t     relay_timeout_s = 60;
  int64_t     cache_bytes     = 128LL * 1024 * 1024;
  int64_t     health_interval_s = 0;
  std::string log_level       = "info";
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads RDG_* variables over the defaults above. Throws
// GatewayError(ConfigError) naming the offending variable.
GatewayConfig loadConfigFromEnv();

// Returns schema_path if set, else looks for schema.sql in the CWD and then
// in the source tree.
std::string findSchemaPath(const GatewayConfig& cfg);

} // namespace rdg
