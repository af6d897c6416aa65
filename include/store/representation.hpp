#pragma once

#include <array>
#include <optional>
#include <string>

namespace hashrange {
namespace store {

// The three on-disk forms of a shard, all derived from the same canonical bytes
enum class Representation {
  Json,
  Gzip,
  Brotli
};

constexpr std::array<Representation, 3> ALL_REPRESENTATIONS = {
  Representation::Json,
  Representation::Gzip,
  Representation::Brotli
};

// File suffix appended to the encoded key path: "json", "json.gz" or "json.br"
const char* extension(Representation representation);
// Content-Encoding token for compressed forms, empty for plain JSON
std::optional<std::string> content_encoding(Representation representation);
// Short name for logs and reports
const char* to_string(Representation representation);

// Which representations the store holds, sampled once from a reference shard
struct StoreCapabilities {
  bool json = false;
  bool gzip = false;
  bool brotli = false;

  bool has(Representation representation) const;
};

} // namespace store
} // namespace hashrange
