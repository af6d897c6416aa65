#include "http/http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

//==============================================
// SESSION
//==============================================

// One connection. Owns the socket, the read buffer and the response in flight,
// so a dropped client releases the open artifact file with the session
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket&& socket, const Router& router)
    : stream_(std::move(socket))
    , router_(router) {}

  void start() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
  }

private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  beast_http::request<beast_http::string_body> request_;
  std::shared_ptr<void> response_;
  const Router& router_;

  void do_read() {
    request_ = {};
    beast_http::async_read(stream_, buffer_, request_,
                           beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == beast_http::error::end_of_stream) {
      return do_close();
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read error: " << ec.message();
      return;
    }

    Request request;
    request.method = request_.method();
    request.target = std::string(request_.target());
    auto range = request_.equal_range(beast_http::field::accept_encoding);
    for (auto it = range.first; it != range.second; ++it) {
      request.accept_encoding.emplace_back(it->value());
    }

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: " << request_.method_string() << " " << request.target;
    send(router_.dispatch(request));
  }

  void send(Response&& response) {
    const bool keep_alive = request_.keep_alive();
    const unsigned version = request_.version();
    const bool head = request_.method() == beast_http::verb::head;

    if (head) {
      beast_http::response<beast_http::empty_body> res{response.status, version};
      set_headers(res, response, keep_alive);
      res.content_length(response.has_file() ? response.file.size() : response.text.size());
      return write(std::move(res));
    }

    if (response.has_file()) {
      beast_http::response<beast_http::file_body> res{response.status, version};
      set_headers(res, response, keep_alive);
      res.body() = std::move(response.file);
      res.prepare_payload();
      return write(std::move(res));
    }

    beast_http::response<beast_http::string_body> res{response.status, version};
    set_headers(res, response, keep_alive);
    res.body() = std::move(response.text);
    res.prepare_payload();
    write(std::move(res));
  }

  template <class Body>
  static void set_headers(beast_http::response<Body>& res, const Response& response, bool keep_alive) {
    res.set(beast_http::field::server, "hashrange");
    res.set(beast_http::field::content_type, response.content_type);
    if (response.content_encoding) {
      res.set(beast_http::field::content_encoding, *response.content_encoding);
    }
    res.keep_alive(keep_alive);
  }

  template <class Body>
  void write(beast_http::response<Body>&& res) {
    auto sp = std::make_shared<beast_http::response<Body>>(std::move(res));
    response_ = sp;
    beast_http::async_write(stream_, *sp,
                            beast::bind_front_handler(&HttpSession::on_write, shared_from_this(),
                                                      sp->need_eof()));
  }

  void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
      // Client went away mid-stream, the session and its open file are released on return
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Write error after " << bytes_transferred
                               << " bytes: " << ec.message();
      return;
    }

    response_.reset();
    if (close) {
      return do_close();
    }
    do_read();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, const Router& router, unsigned threads)
  : address_(address)
  , port_(port)
  , thread_count_(threads > 0 ? threads : 1)
  , is_running_(false)
  , router_(router) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port
                          << " with " << thread_count_ << " threads";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    // Create endpoint
    tcp::endpoint endpoint(net::ip::make_address(address_), port_);

    // Create acceptor, fails here if the address is taken
    // A fresh context per start, so nothing queued by a previous run is resumed
    io_context_ = std::make_unique<net::io_context>();
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_, endpoint);

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    // Run io_context on the worker threads
    for (unsigned i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_->run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on http://" << address_ << ":" << local_port() << "/";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    acceptor_.reset();
    io_context_.reset();
    is_running_ = false;
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Each connection gets its own strand so session handlers never run concurrently
  acceptor_->async_accept(net::make_strand(*io_context_),
    [this](const boost::system::error_code& error, tcp::socket socket) {
      if (!error) {
        std::make_shared<HttpSession>(std::move(socket), router_)->start();
      } else if (error != net::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      if (error != net::error::operation_aborted) {
        start_accept();  // Continue accepting new connections
      }
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context, then join the workers before touching it
  io_context_->stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  // Destroying the context destroys the queued session handlers with it,
  // which closes their sockets and open files
  io_context_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// GETTERS
//==============================================

uint16_t HttpServer::local_port() const {
  if (!acceptor_) {
    return port_;
  }
  boost::system::error_code ec;
  tcp::endpoint endpoint = acceptor_->local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

} // namespace http
} // namespace hashrange
