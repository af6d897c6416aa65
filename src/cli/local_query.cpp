#include "cli/local_query.hpp"
#include <string>
#include <boost/log/trivial.hpp>
#include "build/transcoder.hpp"
#include "codec/compressor.hpp"
#include "store/password_digest.hpp"

namespace hashrange {
namespace cli {

std::uint64_t count_password(const store::ShardStore& store, std::string_view password) {
  const store::PasswordDigest digest = store::digest_password(password);

  std::string canonical;
  if (store.has(digest.key, store::Representation::Json)) {
    store.get(digest.key, store::Representation::Json, canonical);
  } else if (store.has(digest.key, store::Representation::Gzip)) {
    std::string compressed;
    store.get(digest.key, store::Representation::Gzip, compressed);
    canonical = codec::gzip_decompress(compressed);
  } else {
    throw store::StoreError("Query: No readable artifact for range " + digest.key.str() +
                            " under " + store.base_path().string());
  }

  const std::uint64_t count = build::find_count(build::parse_shard_json(canonical), digest.full_hash());
  BOOST_LOG_TRIVIAL(debug) << "Query: Range " << digest.key.str() << " lists the password " << count << " times";
  return count;
}

} // namespace cli
} // namespace hashrange
