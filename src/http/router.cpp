#include "http/router.hpp"
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace http {

//==============================================
// ROUTE REGISTRATION
//==============================================

void Router::add(std::string pattern, Handler handler) {
  BOOST_LOG_TRIVIAL(debug) << "Router: Registered route " << pattern;
  std::vector<std::string> segments = split_path(pattern);
  routes_.push_back(Route{std::move(pattern), std::move(segments), std::move(handler)});
}


//==============================================
// DISPATCH
//==============================================

Response Router::dispatch(const Request& request) const {
  if (request.method != beast_http::verb::get && request.method != beast_http::verb::head) {
    return text_response(beast_http::status::method_not_allowed, "Method not allowed");
  }

  std::string_view path(request.target);
  std::size_t query = path.find('?');
  if (query != std::string_view::npos) {
    path = path.substr(0, query);
  }

  std::vector<std::string> segments = split_path(path);

  for (const auto& route : routes_) {
    RouteParams params;
    if (!match(route, segments, params)) {
      continue;
    }

    try {
      return route.handler(request, params);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Router: Handler for " << route.pattern << " failed: " << e.what();
      return text_response(beast_http::status::internal_server_error, "Internal server error");
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Router: No route for " << request.target;
  return text_response(beast_http::status::not_found, "Not found");
}

std::vector<std::string> Router::split_path(std::string_view path) {
  std::vector<std::string> segments;
  if (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  if (path.empty()) {
    return segments;
  }

  while (true) {
    std::size_t slash = path.find('/');
    segments.emplace_back(path.substr(0, slash));
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return segments;
}

bool Router::match(const Route& route, const std::vector<std::string>& segments, RouteParams& params) {
  if (route.segments.size() != segments.size()) {
    return false;
  }

  for (std::size_t i = 0; i < segments.size(); ++i) {
    const std::string& expected = route.segments[i];
    if (!expected.empty() && expected.front() == ':') {
      params[expected.substr(1)] = segments[i];
    } else if (expected != segments[i]) {
      return false;
    }
  }
  return true;
}

} // namespace http
} // namespace hashrange
