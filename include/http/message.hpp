#pragma once

#include <optional>
#include <string>
#include <vector>
#include <boost/beast/http/file_body.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

namespace hashrange {
namespace http {

namespace beast_http = boost::beast::http;

// Transport independent view of an incoming request, built by the server or directly by tests
struct Request {
  beast_http::verb method = beast_http::verb::get;
  // Raw request target, may carry a query string
  std::string target;
  // Every Accept-Encoding value in arrival order (the header may repeat)
  std::vector<std::string> accept_encoding;
};

// Either a short text body or an open file streamed from disk
struct Response {
  beast_http::status status = beast_http::status::ok;
  std::string content_type = "text/plain";
  std::optional<std::string> content_encoding;
  std::string text;
  beast_http::file_body::value_type file;

  bool has_file() const { return file.is_open(); }
};

// Plain text response with the given status
Response text_response(beast_http::status status, std::string text);

} // namespace http
} // namespace hashrange
