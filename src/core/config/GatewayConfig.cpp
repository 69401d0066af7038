#include "GatewayConfig.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "core/errors/GatewayError.hpp"

namespace rdg {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int64_t env_int_or(const char* key, int64_t defval, int64_t min, int64_t max) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  int64_t v = 0;
  try {
    size_t used = 0;
    v = std::stoll(raw, &used);
    if (used != raw.size()) throw std::invalid_argument("trailing characters");
  } catch (const std::exception&) {
    throw GatewayError(ErrorKind::ConfigError, std::string(key) + " is not an integer: " + raw);
  }
  if (v < min || v > max) {
    throw GatewayError(ErrorKind::ConfigError,
                       std::string(key) + " out of range [" + std::to_string(min) + ", " +
                       std::to_string(max) + "]: " + raw);
  }
  return v;
}

GatewayConfig loadConfigFromEnv() {
  GatewayConfig cfg;
  cfg.db_path           = get_env_or("RDG_DB_PATH", cfg.db_path);
  cfg.schema_path       = get_env_or("RDG_SCHEMA_PATH", cfg.schema_path);
  cfg.bind_address      = get_env_or("RDG_BIND", cfg.bind_address);
  cfg.port              = static_cast<int>(env_int_or("RDG_PORT", cfg.port, 0, 65535));
  cfg.api_key           = get_env_or("RDG_API_KEY", cfg.api_key);
  cfg.chunk_size        = env_int_or("RDG_CHUNK_SIZE", cfg.chunk_size, 1, kMaxChunkSize);
  cfg.rate_limit_ms     = env_int_or("RDG_RATE_LIMIT_MS", cfg.rate_limit_ms, 0, 600000);
  cfg.relay_base_url    = get_env_or("RDG_RELAY_BASE_URL", cfg.relay_base_url);
  cfg.relay_timeout_s   = env_int_or("RDG_RELAY_TIMEOUT_S", cfg.relay_timeout_s, 1, 3600);
  cfg.cache_bytes       = env_int_or("RDG_CACHE_BYTES", cfg.cache_bytes, 0, INT64_MAX);
  cfg.health_interval_s = env_int_or("RDG_HEALTH_INTERVAL_S", cfg.health_interval_s, 0, 86400);
  cfg.log_level         = get_env_or("RDG_LOG_LEVEL", cfg.log_level);
  if (cfg.db_path.empty()) {
    throw GatewayError(ErrorKind::ConfigError, "RDG_DB_PATH must not be empty");
  }
  static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
  bool knownLevel = false;
  for (const char* l : kLevels) knownLevel = knownLevel || cfg.log_level == l;
  if (!knownLevel) {
    throw GatewayError(ErrorKind::ConfigError, "RDG_LOG_LEVEL is not a log level: " + cfg.log_level);
  }
  if (cfg.relay_base_url.empty()) {
    throw GatewayError(ErrorKind::ConfigError, "RDG_RELAY_BASE_URL must not be empty");
  }
  return cfg;
}

std::string findSchemaPath(const GatewayConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schema_path.empty()) {
    if (fs::exists(cfg.schema_path)) return cfg.schema_path;
    throw GatewayError(ErrorKind::ConfigError, "RDG_SCHEMA_PATH does not exist: " + cfg.schema_path);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw GatewayError(ErrorKind::ConfigError,
                     "schema.sql not found (looked in CWD and src/core/metadata)");
}

} // namespace rdg
