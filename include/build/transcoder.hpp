#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "build/range_file_parser.hpp"
#include "store/shard_store.hpp"

namespace hashrange {
namespace build {

// Which artifacts the build emits
struct OutputSelection {
  bool json = true;
  bool gzip = true;
  bool brotli = true;

  bool any() const { return json || gzip || brotli; }
};

// Bytes written per representation
struct ArtifactSizes {
  std::uint64_t json = 0;
  std::uint64_t gzip = 0;
  std::uint64_t brotli = 0;
};


// ---- CANONICAL FORM ----
// Serializes records as [{"hash":"...","count":N},...] in the given order
std::string serialize_shard(const std::vector<Record>& records);
// Inverse of serialize_shard. Throws ParseError on malformed JSON
std::vector<Record> parse_shard_json(std::string_view bytes);
// Count of the record with the given full hash, 0 if absent
std::uint64_t find_count(const std::vector<Record>& records, std::string_view full_hash);


class Transcoder {
public:
  // ---- CONSTRUCTOR ----
  Transcoder(const store::ShardStore& store, OutputSelection selection);

  // ---- TRANSCODING ----
  // Serializes the shard once and writes each selected artifact from those bytes.
  // Throws TranscodeError on compression or write failure
  ArtifactSizes transcode(const Shard& shard) const;

private:
  // ---- PARAMETERS ----
  const store::ShardStore& store_;
  OutputSelection selection_;
};

} // namespace build
} // namespace hashrange
