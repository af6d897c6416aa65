#include "http/bootstrap.hpp"
#include "logger/logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>

bool run_server(const hashrange::http::ServerConfig& config) {
  try {
    hashrange::http::ServerBootstrap bootstrap(config);
    const auto& capabilities = bootstrap.capabilities();
    std::cout << "brotli: " << capabilities.brotli
              << " | gzip: " << capabilities.gzip
              << " | json: " << capabilities.json << std::endl;

    if (!bootstrap.start()) {
      std::cerr << "Error: Failed to bind " << config.host << ":" << config.port << '\n';
      return false;
    }
    std::cout << "starting server at http://" << config.host << ":" << bootstrap.server().local_port()
              << "/" << std::endl;

    // Block the main thread until SIGINT/SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([&bootstrap](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
      }
      bootstrap.shutdown();
    });
    signals_context.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Server: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main() {
  hashrange::http::ServerConfig config;
  try {
    config = hashrange::http::load_server_config();
    hashrange::logger::init_logging(config.logging);
  } catch (const std::exception& e) {
    std::cerr << "Error: Invalid configuration: " << e.what() << '\n';
    return 1;
  }

  return run_server(config) ? 0 : 1;
}
