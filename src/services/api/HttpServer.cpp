#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/catalog/ChannelBinder.hpp"
#include "core/catalog/FileCatalog.hpp"
#include "core/errors/GatewayError.hpp"
#include "core/storage/BackendPool.hpp"
#include "core/storage/ChunkStore.hpp"
#include "core/storage/RangeResolver.hpp"
#include "core/util/Encoding.hpp"

using nlohmann::json;

namespace rdg {

using Handler      = std::function<void(const httplib::Request&, httplib::Response&)>;
using OwnerHandler = std::function<void(const std::string&, const httplib::Request&, httplib::Response&)>;

// -------- response helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(const httplib::Request& req, httplib::Response& res, const GatewayError& e) {
  const int status = httpStatusFor(e.kind());
  json body = {
    {"error", errorKindName(e.kind())},
    {"message", e.what()}
  };
  if (e.chunkIndex()) body["chunk_index"] = *e.chunkIndex();
  if (e.have())       body["have"] = *e.have();
  if (e.want())       body["want"] = *e.want();
  if (!e.existingFileId().empty()) {
    body["file_id"] = e.existingFileId();
    body["duplicate"] = true;
  }
  if (status >= 500) {
    spdlog::error("{} {} -> {} {}: {}", req.method, req.path, status, errorKindName(e.kind()), e.what());
  } else {
    spdlog::warn("{} {} -> {} {}: {}", req.method, req.path, status, errorKindName(e.kind()), e.what());
  }
  send_json(res, status, body);
}

static Handler guarded(Handler h) {
  return [h](const httplib::Request& req, httplib::Response& res) {
    try {
      h(req, res);
    } catch (const GatewayError& e) {
      send_error(req, res, e);
    } catch (const json::exception& e) {
      send_error(req, res, GatewayError(ErrorKind::InvalidRequest, std::string("malformed JSON: ") + e.what()));
    } catch (const std::exception& e) {
      send_error(req, res, GatewayError(ErrorKind::StorageFailure, e.what()));
    }
  };
}

static void check_api_key(const httplib::Request& req, const std::string& apiKey) {
  if (apiKey.empty()) return; // auth disabled
  if (req.get_header_value("X-API-Key") != apiKey) {
    throw GatewayError(ErrorKind::Unauthorized, "missing or wrong X-API-Key");
  }
}

static Handler authed(const std::string& apiKey, OwnerHandler h) {
  return guarded([apiKey, h](const httplib::Request& req, httplib::Response& res) {
    check_api_key(req, apiKey);
    const std::string owner = req.get_header_value("X-Owner-Id");
    if (owner.empty()) {
      throw GatewayError(ErrorKind::Unauthorized, "X-Owner-Id required");
    }
    h(owner, req, res);
  });
}

// -------- request helpers --------

static json body_json(const httplib::Request& req) {
  if (req.body.empty()) return json::object();
  json j = json::parse(req.body);
  if (!j.is_object()) throw GatewayError(ErrorKind::InvalidRequest, "JSON object expected");
  return j;
}

static std::string require_string(const json& j, const char* k) {
  if (!j.contains(k) || !j[k].is_string() || j[k].get<std::string>().empty()) {
    throw GatewayError(ErrorKind::InvalidRequest, std::string(k) + " required");
  }
  return j[k].get<std::string>();
}

static std::string string_or(const json& j, const char* k, const std::string& def = {}) {
  if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
  return def;
}

static int64_t require_int(const json& j, const char* k) {
  if (!j.contains(k) || !j[k].is_number_integer()) {
    throw GatewayError(ErrorKind::InvalidRequest, std::string(k) + " must be an integer");
  }
  return j[k].get<int64_t>();
}

static int64_t parse_int(const std::string& s, const char* what) {
  size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(s, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (s.empty() || used != s.size()) {
    throw GatewayError(ErrorKind::InvalidRequest, std::string(what) + " must be an integer");
  }
  return v;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static std::optional<bool> bool_param(const httplib::Request& req, const char* k) {
  if (!req.has_param(k)) return std::nullopt;
  const std::string v = req.get_param_value(k);
  if (v == "true" || v == "1")  return true;
  if (v == "false" || v == "0") return false;
  throw GatewayError(ErrorKind::InvalidRequest, std::string(k) + " must be true or false");
}

// -------- views --------

static json backend_json(const BackendRecord& b) {
  return {
    {"backend_id", b.backend_id},
    {"display_name", b.display_name},
    {"remote_identity", b.remote_identity},
    {"channel_id", b.remote_channel_id.empty() ? json(nullptr) : json(b.remote_channel_id)},
    {"is_active", b.is_active},
    {"health_status", healthStatusName(b.health_status)},
    {"last_health_check", b.last_health_check},
    {"created_at", b.created_at}
  };
}

static json nullable(const std::string& s) {
  return s.empty() ? json(nullptr) : json(s);
}

static json file_json(const FileRecord& f) {
  return {
    {"file_id", f.file_id},
    {"owner_id", f.owner_id},
    {"name", f.name},
    {"path", f.virtual_path},
    {"size", f.size_bytes},
    {"mime_type", nullable(f.mime_type)},
    {"content_hash", f.content_hash},
    {"chunk_count", f.chunk_count},
    {"chunk_size", f.chunk_size},
    {"is_public", f.is_public},
    {"public_title", nullable(f.public_title)},
    {"public_category", nullable(f.public_category)},
    {"forked_from_file", nullable(f.forked_from_file)},
    {"forked_from_owner", nullable(f.forked_from_owner)},
    {"view_count", f.view_count},
    {"fork_count", f.fork_count},
    {"created_at", f.created_at},
    {"updated_at", f.updated_at}
  };
}

// Quoted ASCII fallback, plus RFC 5987 filename* when the name needs escaping.
static std::string content_disposition(const std::string& name) {
  static const char* hex = "0123456789ABCDEF";
  std::string plain, encoded;
  bool needsExtended = false;
  for (unsigned char c : name) {
    const bool safe = c >= 0x20 && c < 0x7f && c != '"' && c != '\\';
    plain.push_back(safe ? static_cast<char>(c) : '_');
    if (!safe) needsExtended = true;

    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(hex[c >> 4]);
      encoded.push_back(hex[c & 0xF]);
    }
  }
  std::string out = "attachment; filename=\"" + plain + "\"";
  if (needsExtended) out += "; filename*=UTF-8''" + encoded;
  return out;
}

static std::string mime_or_default(const FileRecord& f) {
  return f.mime_type.empty() ? "application/octet-stream" : f.mime_type;
}

// -------- server --------

HttpServer::HttpServer(FileCatalog& catalog,
                       BackendPool& pool,
                       ChunkStore& chunks,
                       ChannelBinder& binder,
                       const std::string& apiKey)
  : catalog_(catalog), pool_(pool), chunks_(chunks), binder_(binder), apiKey_(apiKey),
    svr_(std::make_unique<httplib::Server>()) {
  registerRoutes();
}

HttpServer::~HttpServer() = default;

bool HttpServer::listen(const std::string& host, int port) {
  return svr_->listen(host, port);
}

int HttpServer::bindToAnyPort(const std::string& host) {
  return svr_->bind_to_any_port(host);
}

bool HttpServer::listenAfterBind() {
  return svr_->listen_after_bind();
}

void HttpServer::stop() { svr_->stop(); }

bool HttpServer::isRunning() const { return svr_->is_running(); }

void HttpServer::registerRoutes() {
  httplib::Server& svr = *svr_;
  const std::string& key = apiKey_;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // ---- backends ----

  svr.Post("/api/backends", authed(key, [this](const std::string& owner, const httplib::Request& req,
                                               httplib::Response& res) {
    json j = body_json(req);
    BackendRecord b = pool_.registerBackend(owner, require_string(j, "credential"));
    send_json(res, 201, backend_json(b));
  }));

  svr.Get("/api/backends", authed(key, [this](const std::string& owner, const httplib::Request&,
                                              httplib::Response& res) {
    json list = json::array();
    for (const auto& b : pool_.listBackends(owner)) list.push_back(backend_json(b));
    send_json(res, 200, {{"backends", list}});
  }));

  svr.Post(R"(/api/backends/([^/]+)/health)", authed(key, [this](const std::string& owner,
                                                                 const httplib::Request& req,
                                                                 httplib::Response& res) {
    send_json(res, 200, backend_json(pool_.checkHealth(owner, req.matches[1].str())));
  }));

  svr.Put(R"(/api/backends/([^/]+)/channel)", authed(key, [this](const std::string& owner,
                                                                const httplib::Request& req,
                                                                httplib::Response& res) {
    json j = body_json(req);
    BackendRecord b = pool_.bindChannel(owner, req.matches[1].str(), require_string(j, "channel_id"));
    send_json(res, 200, backend_json(b));
  }));

  svr.Delete(R"(/api/backends/([^/]+))", authed(key, [this](const std::string& owner,
                                                           const httplib::Request& req,
                                                           httplib::Response& res) {
    pool_.deactivateBackend(owner, req.matches[1].str());
    send_json(res, 200, {{"ok", true}});
  }));

  // Relay webhook: no owner, no key; the relay always gets ok.
  svr.Post(R"(/api/webhook/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    binder_.submit(req.matches[1].str(), req.body);
    send_json(res, 200, {{"ok", true}});
  });

  // ---- uploads ----

  // Body: {name, size, mime, content_hash, folder?, is_public?, public_title?, public_category?}
  svr.Post("/api/files/upload/init", authed(key, [this](const std::string& owner,
                                                        const httplib::Request& req,
                                                        httplib::Response& res) {
    json j = body_json(req);
    UploadRequest up;
    up.name            = require_string(j, "name");
    up.size_bytes      = require_int(j, "size");
    up.mime_type       = string_or(j, "mime");
    up.content_hash    = require_string(j, "content_hash");
    up.folder          = string_or(j, "folder");
    up.is_public       = j.contains("is_public") && j["is_public"].is_boolean() && j["is_public"].get<bool>();
    up.public_title    = string_or(j, "public_title");
    up.public_category = string_or(j, "public_category");

    UploadPlan plan = catalog_.initUpload(owner, up);
    json placement = json::array();
    for (const auto& p : plan.placement) {
      placement.push_back({{"chunk_index", p.chunk_index}, {"backend_id", p.backend_id}});
    }
    send_json(res, 200, {
      {"file_id", plan.file_id},
      {"chunk_count", plan.chunk_count},
      {"chunk_size", plan.chunk_size},
      {"duplicate", plan.duplicate},
      {"placement", placement}
    });
  }));

  // JSON {file_id, chunk_index, chunk_bytes_b64, chunk_content_hash}, or a raw
  // octet-stream body with ?file_id=&chunk_index= and X-Chunk-Hash.
  svr.Post("/api/files/upload/chunk", authed(key, [this](const std::string& owner,
                                                         const httplib::Request& req,
                                                         httplib::Response& res) {
    std::string fileId, hash;
    int64_t index = 0;
    std::shared_ptr<const std::string> bytes;

    const std::string ctype = req.get_header_value("Content-Type");
    if (ctype.rfind("application/octet-stream", 0) == 0) {
      fileId = param_or(req, "file_id");
      if (fileId.empty()) throw GatewayError(ErrorKind::InvalidRequest, "file_id required");
      index = parse_int(param_or(req, "chunk_index"), "chunk_index");
      hash  = req.get_header_value("X-Chunk-Hash");
      bytes = std::make_shared<const std::string>(req.body);
    } else {
      json j = body_json(req);
      fileId = require_string(j, "file_id");
      index  = require_int(j, "chunk_index");
      hash   = require_string(j, "chunk_content_hash");
      bytes  = std::make_shared<const std::string>(base64_decode(require_string(j, "chunk_bytes_b64")));
    }

    ChunkRecord rec = catalog_.uploadChunk(owner, fileId, index, bytes, hash);
    send_json(res, 200, {
      {"chunk_index", rec.chunk_index},
      {"accepted", true},
      {"backend_id", rec.backend_id}
    });
  }));

  svr.Post("/api/files/upload/complete", authed(key, [this](const std::string& owner,
                                                            const httplib::Request& req,
                                                            httplib::Response& res) {
    json j = body_json(req);
    FileRecord f = catalog_.completeUpload(owner, require_string(j, "file_id"));
    send_json(res, 200, {{"ok", true}, {"file", file_json(f)}});
  }));

  // ---- files ----

  svr.Get("/api/files", authed(key, [this](const std::string& owner, const httplib::Request& req,
                                           httplib::Response& res) {
    FileFilter filter;
    filter.folder_prefix = param_or(req, "folder");
    filter.mime_prefix   = param_or(req, "mime");
    filter.search        = param_or(req, "q");
    filter.is_public     = bool_param(req, "public");
    if (req.has_param("limit"))  filter.limit  = parse_int(req.get_param_value("limit"), "limit");
    if (req.has_param("offset")) filter.offset = parse_int(req.get_param_value("offset"), "offset");

    json list = json::array();
    for (const auto& f : catalog_.listFiles(owner, filter)) list.push_back(file_json(f));
    send_json(res, 200, {{"files", list}, {"limit", filter.limit}, {"offset", filter.offset}});
  }));

  svr.Get(R"(/api/files/([^/]+))", authed(key, [this](const std::string& owner,
                                                      const httplib::Request& req,
                                                      httplib::Response& res) {
    send_json(res, 200, file_json(catalog_.getFile(owner, req.matches[1].str())));
  }));

  svr.Put(R"(/api/files/([^/]+))", authed(key, [this](const std::string& owner,
                                                      const httplib::Request& req,
                                                      httplib::Response& res) {
    json j = body_json(req);
    FileUpdate up;
    if (j.contains("name"))            up.name = require_string(j, "name");
    if (j.contains("folder"))          up.folder = string_or(j, "folder");
    if (j.contains("public_title"))    up.public_title = string_or(j, "public_title");
    if (j.contains("public_category")) up.public_category = string_or(j, "public_category");
    if (j.contains("is_public")) {
      if (!j["is_public"].is_boolean()) throw GatewayError(ErrorKind::InvalidRequest, "is_public must be a boolean");
      up.is_public = j["is_public"].get<bool>();
    }
    send_json(res, 200, file_json(catalog_.updateFile(owner, req.matches[1].str(), up)));
  }));

  svr.Delete(R"(/api/files/([^/]+))", authed(key, [this](const std::string& owner,
                                                         const httplib::Request& req,
                                                         httplib::Response& res) {
    catalog_.deleteFile(owner, req.matches[1].str());
    send_json(res, 200, {{"ok", true}});
  }));

  // Body streamed one chunk at a time. httplib slices a single Range from
  // the provider and answers 206 with Content-Range itself.
  auto serve_body = [this](const std::string& owner, const httplib::Request& req,
                           httplib::Response& res, bool attachment) {
    const std::string fileId = req.matches[1].str();
    FileRecord f = catalog_.resolve(owner, fileId);

    std::optional<ByteRange> range;
    if (req.has_header("Range")) range = parseRangeHeader(req.get_header_value("Range"), f.size_bytes);
    if (range) {
      chunks_.checkReadable(fileId, range->start, range->end);
    } else {
      chunks_.checkReadable(fileId, 0, f.size_bytes - 1);
    }

    res.set_header("Accept-Ranges", "bytes");
    if (attachment) {
      res.set_header("Content-Disposition", content_disposition(f.name));
    }
    res.set_content_provider(
      static_cast<size_t>(f.size_bytes), mime_or_default(f),
      [this, fileId](size_t offset, size_t length, httplib::DataSink& sink) {
        try {
          std::string part = chunks_.readSpan(fileId, static_cast<int64_t>(offset),
                                              static_cast<int64_t>(length));
          return sink.write(part.data(), part.size());
        } catch (const std::exception& e) {
          spdlog::error("body of {} aborted at byte {}: {}", fileId, offset, e.what());
          return false;
        }
      });
  };

  svr.Get(R"(/api/files/([^/]+)/download)", authed(key, [serve_body](const std::string& owner,
                                                                     const httplib::Request& req,
                                                                     httplib::Response& res) {
    serve_body(owner, req, res, true);
  }));

  svr.Get(R"(/api/files/([^/]+)/stream)", authed(key, [serve_body](const std::string& owner,
                                                                   const httplib::Request& req,
                                                                   httplib::Response& res) {
    serve_body(owner, req, res, false);
  }));

  svr.Post(R"(/api/files/([^/]+)/fork)", authed(key, [this](const std::string& owner,
                                                           const httplib::Request& req,
                                                           httplib::Response& res) {
    FileRecord f = catalog_.fork(owner, req.matches[1].str());
    send_json(res, 201, file_json(f));
  }));

  svr.Post(R"(/api/files/([^/]+)/view)", authed(key, [this](const std::string&,
                                                           const httplib::Request& req,
                                                           httplib::Response& res) {
    catalog_.recordView(req.matches[1].str());
    send_json(res, 200, {{"ok", true}});
  }));

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) {
      res.set_content(json({{"error", "NotFound"}, {"message", "no such route"}}).dump(), "application/json");
    }
  });
}

void run_http_server(HttpServer& server, const std::string& host, int port) {
  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!server.listen(host, port)) {
    throw GatewayError(ErrorKind::ConfigError, "failed to bind " + host + ":" + std::to_string(port));
  }
}

} // namespace rdg
