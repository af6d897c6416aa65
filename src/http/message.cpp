#include "http/message.hpp"

namespace hashrange {
namespace http {

Response text_response(beast_http::status status, std::string text) {
  Response response;
  response.status = status;
  response.text = std::move(text);
  return response;
}

} // namespace http
} // namespace hashrange
