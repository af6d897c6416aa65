#include "store/representation.hpp"

namespace hashrange {
namespace store {

const char* extension(Representation representation) {
  switch (representation) {
    case Representation::Json:   return "json";
    case Representation::Gzip:   return "json.gz";
    case Representation::Brotli: return "json.br";
    default:                     return "json";
  }
}

std::optional<std::string> content_encoding(Representation representation) {
  switch (representation) {
    case Representation::Gzip:   return std::string("gzip");
    case Representation::Brotli: return std::string("br");
    default:                     return std::nullopt;
  }
}

const char* to_string(Representation representation) {
  switch (representation) {
    case Representation::Json:   return "json";
    case Representation::Gzip:   return "gz";
    case Representation::Brotli: return "br";
    default:                     return "unknown";
  }
}

bool StoreCapabilities::has(Representation representation) const {
  switch (representation) {
    case Representation::Json:   return json;
    case Representation::Gzip:   return gzip;
    case Representation::Brotli: return brotli;
    default:                     return false;
  }
}

} // namespace store
} // namespace hashrange
