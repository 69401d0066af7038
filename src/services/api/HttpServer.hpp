#pragma once
#include <memory>
#include <string>

namespace httplib { class Server; }

namespace rdg {

class FileCatalog;
class BackendPool;
class ChunkStore;
class ChannelBinder;

// JSON API over the catalog. Owner identity arrives in X-Owner-Id from the
// auth layer in front; X-API-Key is checked first when apiKey is non-empty.
class HttpServer {
public:
  HttpServer(FileCatalog& catalog,
             BackendPool& pool,
             ChunkStore& chunks,
             ChannelBinder& binder,
             const std::string& apiKey);
  ~HttpServer();

  // Blocks until stop().
  bool listen(const std::string& host, int port);

  // For tests: bind an ephemeral port, then serve on it.
  int bindToAnyPort(const std::string& host);
  bool listenAfterBind();

  void stop();
  bool isRunning() const;

private:
  void registerRoutes();

  FileCatalog& catalog_;
  BackendPool& pool_;
  ChunkStore& chunks_;
  ChannelBinder& binder_;
  std::string apiKey_;
  std::unique_ptr<httplib::Server> svr_;
};

// Logs, then serves on host:port until the server stops.
void run_http_server(HttpServer& server, const std::string& host, int port);

} // namespace rdg
