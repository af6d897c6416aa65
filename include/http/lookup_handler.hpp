#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "http/message.hpp"
#include "http/negotiation.hpp"
#include "store/shard_store.hpp"

namespace hashrange {
namespace http {

// Serves GET /<range key>: validate, negotiate, locate, stream
class LookupHandler {
public:
  // ---- CONSTRUCTOR ----
  // capabilities are sampled once by the caller and never refreshed
  LookupHandler(const store::ShardStore& store, store::StoreCapabilities capabilities);


  // ---- REQUEST HANDLING ----
  // 400 for a malformed key or Accept-Encoding value (no filesystem access),
  // 404 when nothing can be served, otherwise 200 with the artifact opened for streaming
  Response handle(std::string_view segment, const std::vector<std::string>& accept_encoding) const;

  const store::StoreCapabilities& capabilities() const { return capabilities_; }

private:
  // ---- PARAMETERS ----
  const store::ShardStore& store_;
  const store::StoreCapabilities capabilities_;
};

// Static landing page for GET /
Response index_page();

} // namespace http
} // namespace hashrange
