#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "http/message.hpp"

namespace hashrange {
namespace http {

using RouteParams = std::map<std::string, std::string>;
using Handler = std::function<Response(const Request&, const RouteParams&)>;

// Ordered list of (pattern, handler) pairs. A pattern is a literal path ("/")
// or a sequence of segments where ":name" captures exactly one segment ("/:hash5")
class Router {
public:
  // ---- ROUTE REGISTRATION ----
  void add(std::string pattern, Handler handler);


  // ---- DISPATCH ----
  // First matching route wins. Unmatched paths yield 404 and methods
  // other than GET/HEAD yield 405. Exceptions from a handler yield 500
  Response dispatch(const Request& request) const;

  std::size_t size() const { return routes_.size(); }

private:
  struct Route {
    std::string pattern;
    std::vector<std::string> segments;
    Handler handler;
  };

  // ---- PARAMETERS ----
  std::vector<Route> routes_;

  static std::vector<std::string> split_path(std::string_view path);
  static bool match(const Route& route, const std::vector<std::string>& segments, RouteParams& params);
};

} // namespace http
} // namespace hashrange
