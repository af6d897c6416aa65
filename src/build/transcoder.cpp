#include "build/transcoder.hpp"
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include "codec/compressor.hpp"

namespace hashrange {
namespace build {

// Keeps "hash" ahead of "count" in every object
using json = nlohmann::ordered_json;

//==============================================
// CANONICAL FORM
//==============================================

std::string serialize_shard(const std::vector<Record>& records) {
  json array = json::array();
  for (const auto& record : records) {
    json entry;
    entry["hash"] = record.hash;
    entry["count"] = record.count;
    array.push_back(std::move(entry));
  }
  return array.dump();
}

std::vector<Record> parse_shard_json(std::string_view bytes) {
  std::vector<Record> records;

  try {
    json document = json::parse(bytes.begin(), bytes.end());
    if (!document.is_array()) {
      throw ParseError("shard document is not a JSON array");
    }

    records.reserve(document.size());
    for (const auto& entry : document) {
      if (!entry.is_object() || !entry.contains("hash") || !entry.contains("count") ||
          !entry["hash"].is_string() || !entry["count"].is_number_unsigned()) {
        throw ParseError("shard entry is not a {hash, count} object: " + entry.dump());
      }
      records.push_back(Record{entry["hash"].get<std::string>(), entry["count"].get<std::uint64_t>()});
    }
  } catch (const json::exception& e) {
    throw ParseError(std::string("invalid shard JSON: ") + e.what());
  }

  return records;
}

std::uint64_t find_count(const std::vector<Record>& records, std::string_view full_hash) {
  for (const auto& record : records) {
    if (record.hash == full_hash) {
      return record.count;
    }
  }
  return 0;
}


//==============================================
// CONSTRUCTOR
//==============================================

Transcoder::Transcoder(const store::ShardStore& store, OutputSelection selection)
  : store_(store)
  , selection_(selection) {
  BOOST_LOG_TRIVIAL(debug) << "Transcoder: Initialized with json: " << selection_.json
                           << " | gzip: " << selection_.gzip
                           << " | brotli: " << selection_.brotli;
}


//==============================================
// TRANSCODING
//==============================================

ArtifactSizes Transcoder::transcode(const Shard& shard) const {
  ArtifactSizes sizes;
  const std::string serialized = serialize_shard(shard.records);

  try {
    if (selection_.json) {
      sizes.json = store_.put(shard.key, store::Representation::Json, serialized);
    }

    if (selection_.gzip) {
      sizes.gzip = store_.put(shard.key, store::Representation::Gzip, codec::gzip_compress(serialized));
    }

    if (selection_.brotli) {
      sizes.brotli = store_.put(shard.key, store::Representation::Brotli, codec::brotli_compress(serialized));
    }
  } catch (const store::StoreError& e) {
    throw TranscodeError(shard.key.str() + ": " + e.what());
  } catch (const codec::CompressionError& e) {
    throw TranscodeError(shard.key.str() + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(trace) << "Transcoder: Shard " << shard.key.str() << " with " << shard.records.size()
                           << " records -> json " << sizes.json << " | gz " << sizes.gzip
                           << " | br " << sizes.brotli;
  return sizes;
}

} // namespace build
} // namespace hashrange
