#include "http/bootstrap.hpp"
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <thread>
#include <boost/asio/ip/address.hpp>
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace http {

namespace {

unsigned long parse_number(const std::string& name, const std::string& text, unsigned long max) {
  // stoul would skip leading whitespace and accept a sign
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
    throw std::invalid_argument(name + " is not a number: '" + text + "'");
  }

  std::size_t consumed = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(text, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(name + " is not a number: '" + text + "'");
  }
  if (consumed != text.size() || value > max) {
    throw std::invalid_argument(name + " is out of range: '" + text + "'");
  }
  return value;
}

} // namespace


//==============================================
// CONFIGURATION
//==============================================

ServerConfig load_server_config(const EnvLookup& lookup) {
  ServerConfig config;

  if (auto root = lookup("ROOT")) {
    config.root = *root;
  }

  if (auto host = lookup("HOST")) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(*host, ec);
    if (ec) {
      throw std::invalid_argument("HOST is not an IP address: '" + *host + "'");
    }
    config.host = *host;
  }

  if (auto port = lookup("PORT")) {
    config.port = static_cast<uint16_t>(parse_number("PORT", *port, std::numeric_limits<uint16_t>::max()));
  }

  if (auto threads = lookup("THREADS")) {
    config.threads = static_cast<unsigned>(parse_number("THREADS", *threads, 1024));
  }
  if (config.threads == 0) {
    config.threads = std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1;
  }

  if (auto level = lookup("LOG_LEVEL")) {
    config.logging.min_level = logger::parse_severity(*level);
  }

  if (auto file = lookup("LOG_FILE")) {
    config.logging.log_file = *file;
  }

  return config;
}

ServerConfig load_server_config() {
  return load_server_config([](const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (!value) {
      return std::nullopt;
    }
    return std::string(value);
  });
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ServerBootstrap::ServerBootstrap(ServerConfig config)
  : config_(std::move(config)) {

  if (config_.root.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Using current working directory as root";
  } else {
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Root: " << config_.root.string();
  }

  try {
    store_ = std::make_unique<store::ShardStore>(config_.root);

    // Sampled once, never refreshed for the lifetime of the process
    capabilities_ = store_->detect_capabilities();

    lookup_ = std::make_unique<LookupHandler>(*store_, capabilities_);

    router_.add("/", [](const Request&, const RouteParams&) {
      return index_page();
    });
    router_.add("/:hash5", [this](const Request& request, const RouteParams& params) {
      return lookup_->handle(params.at("hash5"), request.accept_encoding);
    });

    server_ = std::make_unique<HttpServer>(config_.host, config_.port, router_, config_.threads);
    BOOST_LOG_TRIVIAL(info) << "Bootstrap: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap: Failed to initialize components: " << e.what();
    throw;
  }
}

ServerBootstrap::~ServerBootstrap() {
  shutdown();
}


//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool ServerBootstrap::start() {
  BOOST_LOG_TRIVIAL(info) << "Bootstrap: Starting server at http://" << config_.host << ":" << config_.port << "/";
  if (!server_->start_listener()) {
    BOOST_LOG_TRIVIAL(fatal) << "Bootstrap: Failed to bind " << config_.host << ":" << config_.port;
    return false;
  }
  return true;
}

void ServerBootstrap::shutdown() {
  if (server_) {
    server_->shutdown();
  }
}

} // namespace http
} // namespace hashrange
