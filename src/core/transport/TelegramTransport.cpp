#include "TelegramTransport.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "core/util/Encoding.hpp"

using nlohmann::json;

namespace rdg {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

ErrorKind classifyRelayFailure(int code, const std::string& description) {
  const std::string d = lower(description);
  if (code == 429 || d.find("too many requests") != std::string::npos) {
    return ErrorKind::RateLimited;
  }
  if (code == 401 || d.find("unauthorized") != std::string::npos) {
    return ErrorKind::InvalidCredential;
  }
  if (code == 404) return ErrorKind::BlobNotFound;
  if (d.find("message to forward not found") != std::string::npos ||
      d.find("message_id_invalid") != std::string::npos) {
    return ErrorKind::BlobNotFound;
  }
  if (code == 400 && d.find("file") != std::string::npos &&
      (d.find("not found") != std::string::npos || d.find("invalid") != std::string::npos ||
       d.find("wrong") != std::string::npos)) {
    return ErrorKind::BlobNotFound;
  }
  return ErrorKind::TransportUnavailable;
}

TelegramTransport::TelegramTransport(TelegramTransportOptions opts,
                                     std::shared_ptr<RateLimiter> limiter)
  : opts_(std::move(opts)), limiter_(std::move(limiter)) {}

std::unique_ptr<httplib::Client> TelegramTransport::makeClient() const {
  auto cli = std::make_unique<httplib::Client>(opts_.base_url);
  if (!cli->is_valid()) {
    throw GatewayError(ErrorKind::TransportUnavailable,
                       "relay endpoint is not usable: " + opts_.base_url);
  }
  const auto secs = static_cast<time_t>(opts_.timeout.count());
  cli->set_connection_timeout(secs, 0);
  cli->set_read_timeout(secs, 0);
  cli->set_write_timeout(secs, 0);
  return cli;
}

// A relay reply whose fields have unexpected JSON types.
[[noreturn]] static void malformedReply(const std::string& method, const json::exception& e) {
  throw GatewayError(ErrorKind::TransportUnavailable,
                     method + ": malformed response: " + e.what());
}

// Unwraps {"ok": true, "result": ...} or throws the classified failure.
static json parseReply(const std::string& method, const std::string& credential,
                       const httplib::Result& res) {
  if (!res) {
    throw GatewayError(ErrorKind::TransportUnavailable,
                       method + ": " + httplib::to_string(res.error()));
  }

  json payload = json::parse(res->body, nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    const ErrorKind kind = res->status == 200 ? ErrorKind::TransportUnavailable
                                              : classifyRelayFailure(res->status, res->body);
    throw GatewayError(kind, method + ": unexpected response (HTTP " +
                             std::to_string(res->status) + ")");
  }

  try {
    if (!payload.value("ok", false)) {
      const int code = payload.value("error_code", res->status);
      const std::string desc = payload.value("description", std::string());
      const ErrorKind kind = classifyRelayFailure(code, desc);
      if (kind == ErrorKind::RateLimited) {
        int retryAfter = 0;
        if (payload.contains("parameters") && payload["parameters"].is_object()) {
          retryAfter = payload["parameters"].value("retry_after", 0);
        }
        spdlog::warn("relay rate limited {} for {} (retry after {}s)",
                     method, redact(credential), retryAfter);
      }
      throw GatewayError(kind, method + " failed: " + std::to_string(code) + " " + desc);
    }
  } catch (const json::exception& e) {
    malformedReply(method, e);
  }
  if (!payload.contains("result")) {
    throw GatewayError(ErrorKind::TransportUnavailable, method + ": response without result");
  }
  return payload["result"];
}

void TelegramTransport::throttle(const std::string& credential, const std::string& method) {
  const auto waited = limiter_->acquire(credential);
  if (waited.count() > 0) {
    spdlog::debug("relay {} for {} throttled {}ms", method, redact(credential), waited.count());
  }
}

json TelegramTransport::callJson(const std::string& credential, const std::string& method,
                                 const json& params) {
  throttle(credential, method);
  auto cli = makeClient();
  return parseReply(method, credential,
                    cli->Post("/bot" + credential + "/" + method, params.dump(), "application/json"));
}

RelayIdentity TelegramTransport::identify(const std::string& credential) {
  const json me = callJson(credential, "getMe", json::object());
  RelayIdentity id;
  try {
    if (me.contains("id") && me["id"].is_number_integer()) {
      id.id = std::to_string(me["id"].get<int64_t>());
    }
    id.username     = me.value("username", std::string());
    id.display_name = me.value("first_name", std::string());
    id.is_bot       = me.value("is_bot", false);
  } catch (const json::exception& e) {
    malformedReply("getMe", e);
  }
  if (id.id.empty()) {
    throw GatewayError(ErrorKind::TransportUnavailable, "getMe: response without id");
  }
  return id;
}

BlobPlacement TelegramTransport::putBlob(const std::string& credential, const std::string& channel,
                                         std::string_view bytes, const std::string& name) {
  httplib::MultipartFormDataItems items = {
    {"chat_id", channel, "", ""},
    {"document", std::string(bytes), name, "application/octet-stream"},
  };
  throttle(credential, "sendDocument");
  auto cli = makeClient();
  const json msg = parseReply("sendDocument", credential,
                              cli->Post("/bot" + credential + "/sendDocument", items));

  BlobPlacement out;
  try {
    if (!msg.contains("document") || !msg["document"].is_object() ||
        !msg.contains("message_id")) {
      throw GatewayError(ErrorKind::TransportUnavailable, "sendDocument: no document in response");
    }
    out.message_ref = std::to_string(msg["message_id"].get<int64_t>());
    out.blob_ref    = msg["document"].value("file_id", std::string());
  } catch (const json::exception& e) {
    malformedReply("sendDocument", e);
  }
  if (out.blob_ref.empty()) {
    throw GatewayError(ErrorKind::TransportUnavailable, "sendDocument: document without file_id");
  }
  spdlog::debug("relay stored {} bytes as message {} in {}", bytes.size(), out.message_ref, channel);
  return out;
}

std::string TelegramTransport::getBlobBytes(const std::string& credential,
                                            const std::string& blob_ref) {
  const json file = callJson(credential, "getFile", json{{"file_id", blob_ref}});
  std::string filePath;
  try {
    filePath = file.value("file_path", std::string());
  } catch (const json::exception& e) {
    malformedReply("getFile", e);
  }
  if (filePath.empty()) {
    throw GatewayError(ErrorKind::BlobNotFound, "getFile: file path not available");
  }

  auto cli = makeClient();
  auto res = cli->Get("/file/bot" + credential + "/" + filePath);
  if (!res) {
    throw GatewayError(ErrorKind::TransportUnavailable,
                       "file download: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    throw GatewayError(classifyRelayFailure(res->status, res->body),
                       "file download failed: HTTP " + std::to_string(res->status));
  }
  return std::move(res->body);
}

std::optional<std::string> TelegramTransport::resolveBlobFromMessage(const std::string& credential,
                                                                     const std::string& channel,
                                                                     const std::string& message_ref) {
  int64_t messageId = 0;
  try {
    messageId = std::stoll(message_ref);
  } catch (const std::logic_error&) {
    spdlog::warn("message reference '{}' is not a relay message id", message_ref);
    return std::nullopt;
  }

  json forwarded;
  try {
    forwarded = callJson(credential, "forwardMessage",
                         json{{"chat_id", channel}, {"from_chat_id", channel},
                              {"message_id", messageId}});
  } catch (const GatewayError& e) {
    if (e.kind() == ErrorKind::BlobNotFound) return std::nullopt;
    throw;
  }

  std::optional<std::string> blobRef;
  try {
    if (forwarded.contains("document") && forwarded["document"].is_object()) {
      const std::string fileId = forwarded["document"].value("file_id", std::string());
      if (!fileId.empty()) blobRef = fileId;
    }
  } catch (const json::exception& e) {
    malformedReply("forwardMessage", e);
  }

  // The forwarded copy only exists to expose a fresh handle.
  if (forwarded.contains("message_id")) {
    try {
      callJson(credential, "deleteMessage",
               json{{"chat_id", channel}, {"message_id", forwarded["message_id"]}});
    } catch (const GatewayError& e) {
      spdlog::warn("could not delete forwarded copy in {}: {}", channel, e.what());
    }
  }
  return blobRef;
}

void TelegramTransport::sendNotice(const std::string& credential, const std::string& channel,
                                   const std::string& text) {
  callJson(credential, "sendMessage", json{{"chat_id", channel}, {"text", text}});
}

} // namespace rdg
