#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "http/http_server.hpp"
#include "http/lookup_handler.hpp"
#include "http/router.hpp"
#include "logger/logger.hpp"
#include "store/shard_store.hpp"

namespace hashrange {
namespace http {

struct ServerConfig {
  // Empty means the current working directory
  std::filesystem::path root;
  std::string host = "127.0.0.1";
  uint16_t port = 8080;
  unsigned threads = 0;  // 0 selects hardware concurrency
  logger::LogConfig logging;
};

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

// Reads ROOT, HOST, PORT, THREADS, LOG_LEVEL and LOG_FILE.
// Throws std::invalid_argument for an unparsable host, port, thread count or log level
ServerConfig load_server_config(const EnvLookup& lookup);
// Same, reading the process environment
ServerConfig load_server_config();

class ServerBootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Detects the store capabilities once and wires the routes
  explicit ServerBootstrap(ServerConfig config);
  ~ServerBootstrap();

  // Routes and the server hold references into this object
  ServerBootstrap(const ServerBootstrap&) = delete;
  ServerBootstrap& operator=(const ServerBootstrap&) = delete;


  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the listener, false if the socket cannot be bound
  bool start();
  void shutdown();


  // ---- GETTERS ----
  const store::StoreCapabilities& capabilities() const { return capabilities_; }
  const Router& router() const { return router_; }
  HttpServer& server() { return *server_; }
  const ServerConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ServerConfig config_;

  // System components
  std::unique_ptr<store::ShardStore> store_;
  store::StoreCapabilities capabilities_;
  std::unique_ptr<LookupHandler> lookup_;
  Router router_;
  std::unique_ptr<HttpServer> server_;
};

} // namespace http
} // namespace hashrange
