#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "http/router.hpp"

namespace hashrange {
namespace http {

// HTTP/1.1 listener built on Boost.Beast. Each accepted connection gets a session
// that reads requests, dispatches them through the router and streams the response
class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const std::string& address, uint16_t port, const Router& router, unsigned threads = 1);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds, starts accepting and runs the io_context on the worker threads.
  // Returns false if already running or if the endpoint cannot be bound
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Actual bound port, useful when constructed with port 0
  uint16_t local_port() const;

private:

  // ---- PARAMETERS ----
  // Network parameters
  const std::string address_;
  const uint16_t port_;
  const unsigned thread_count_;

  // Server state
  std::atomic<bool> is_running_;
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  // Recreated on every start
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Request dispatch
  const Router& router_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that hands each connection to a new session
  void start_accept();
};

} // namespace http
} // namespace hashrange
