#include "http/lookup_handler.hpp"
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/file_base.hpp>
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace http {

namespace {

constexpr const char* INDEX_HTML =
  "<!DOCTYPE html>\n"
  "<html>\n"
  "<head><title>hashrange</title></head>\n"
  "<body>\n"
  "<h1>hashrange</h1>\n"
  "<p>k-anonymity password hash range lookups.</p>\n"
  "<p>Request <code>GET /&lt;first 5 hex characters of the SHA-1&gt;</code> to receive a JSON array of\n"
  "<code>{\"hash\", \"count\"}</code> records sharing that prefix. Send <code>Accept-Encoding: br</code> or\n"
  "<code>gzip</code> for a pre-compressed body.</p>\n"
  "</body>\n"
  "</html>\n";

} // namespace

Response index_page() {
  Response response;
  response.content_type = "text/html; charset=utf-8";
  response.text = INDEX_HTML;
  return response;
}


//==============================================
// CONSTRUCTOR
//==============================================

LookupHandler::LookupHandler(const store::ShardStore& store, store::StoreCapabilities capabilities)
  : store_(store)
  , capabilities_(capabilities) {
  BOOST_LOG_TRIVIAL(info) << "Lookup: Serving from " << store_.base_path()
                          << " with brotli: " << capabilities_.brotli
                          << " | gzip: " << capabilities_.gzip
                          << " | json: " << capabilities_.json;
}


//==============================================
// REQUEST HANDLING
//==============================================

Response LookupHandler::handle(std::string_view segment, const std::vector<std::string>& accept_encoding) const {
  // Step 1: validate before touching the filesystem
  std::optional<store::RangeKey> key;
  try {
    key = store::decode(segment);
  } catch (const store::InvalidKeyError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Lookup: Rejected key '" << segment << "': " << e.what();
    return text_response(beast_http::status::bad_request, e.what());
  }

  // Step 2: negotiate
  AcceptedEncodings accepted;
  try {
    accepted = parse_accept_encoding(accept_encoding);
  } catch (const NegotiationError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Lookup: " << e.what();
    return text_response(beast_http::status::bad_request, e.what());
  }

  std::optional<store::Representation> representation = choose_representation(capabilities_, accepted);
  if (!representation) {
    BOOST_LOG_TRIVIAL(warning) << "Lookup: No representation available for " << key->str();
    return text_response(beast_http::status::not_found, "File not found: no representation available");
  }

  // Step 3: locate
  std::filesystem::path path = store_.artifact_path(*key, *representation);
  BOOST_LOG_TRIVIAL(debug) << "Lookup: " << key->str() << " -> " << path.string()
                           << " (" << store::to_string(*representation) << ")";

  // Step 4: open for streaming, a missing artifact is a 404 not a server fault
  Response response;
  boost::beast::error_code ec;
  response.file.open(path.string().c_str(), boost::beast::file_mode::scan, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Lookup: Failed to open " << path.string() << ": " << ec.message();
    return text_response(beast_http::status::not_found, "File not found: " + ec.message());
  }

  response.content_type = "application/json";
  response.content_encoding = store::content_encoding(*representation);
  return response;
}

} // namespace http
} // namespace hashrange
