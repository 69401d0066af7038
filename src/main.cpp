// src/main.cpp
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/catalog/ChannelBinder.hpp"
#include "core/catalog/FileCatalog.hpp"
#include "core/config/GatewayConfig.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/storage/BackendPool.hpp"
#include "core/storage/ChunkCache.hpp"
#include "core/storage/ChunkStore.hpp"
#include "core/storage/ChunkWriter.hpp"
#include "core/storage/HealthMonitor.hpp"
#include "core/storage/ReferenceRepair.hpp"
#include "core/transport/RateLimiter.hpp"
#include "core/transport/TelegramTransport.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (RDG_PORT or 8080)\n";
}

static void init_db(const rdg::GatewayConfig& cfg) {
  const std::string schemaPath = rdg::findSchemaPath(cfg);
  ensure_dirs_for(cfg.db_path);
  initDatabase(cfg.db_path, schemaPath);
}

static int serve(const rdg::GatewayConfig& cfg) {
  // Self-heal DB on startup (idempotent)
  init_db(cfg);

  rdg::MetadataStore store(cfg.db_path);

  auto limiter = std::make_shared<rdg::RateLimiter>(std::chrono::milliseconds(cfg.rate_limit_ms));
  rdg::TelegramTransportOptions topts;
  topts.base_url = cfg.relay_base_url;
  topts.timeout  = std::chrono::seconds(cfg.relay_timeout_s);
  rdg::TelegramTransport transport(topts, limiter);

  std::shared_ptr<rdg::ChunkCache> cache;
  if (cfg.cache_bytes > 0) {
    cache = std::make_shared<rdg::ChunkCache>(static_cast<size_t>(cfg.cache_bytes));
  }

  rdg::BackendPool pool(store, transport);
  rdg::ReferenceRepair repair(store, transport);
  rdg::ChunkStore chunks(store, transport, repair, cache, cfg.chunk_size);
  rdg::ChunkWriter writer(chunks);
  rdg::FileCatalog catalog(store, pool, chunks, writer);

  rdg::ChannelBinder binder(store, transport);
  binder.start();

  std::unique_ptr<rdg::HealthMonitor> monitor;
  if (cfg.health_interval_s > 0) {
    monitor = std::make_unique<rdg::HealthMonitor>(pool, std::chrono::seconds(cfg.health_interval_s));
    monitor->start();
  }

  if (cfg.api_key.empty()) {
    spdlog::warn("RDG_API_KEY not set; shared key check disabled");
  }
  spdlog::info("chunk size {} bytes, relay interval {} ms, cache {} bytes",
               cfg.chunk_size, cfg.rate_limit_ms, cfg.cache_bytes);

  rdg::HttpServer server(catalog, pool, chunks, binder, cfg.api_key);
  rdg::run_http_server(server, cfg.bind_address, cfg.port);

  if (monitor) monitor->stop();
  binder.stop();
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const rdg::GatewayConfig cfg = rdg::loadConfigFromEnv();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      init_db(cfg);
      std::cout << "DB initialized at: " << cfg.db_path << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      return serve(cfg);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
