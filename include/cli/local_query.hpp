#pragma once

#include <cstdint>
#include <string_view>
#include "store/shard_store.hpp"

namespace hashrange {
namespace cli {

// Occurrence count of a password in a built store, 0 if it is not listed.
// Reads the shard's .json artifact, or decompresses .json.gz when plain JSON was not built.
// Throws store::StoreError if neither artifact exists
std::uint64_t count_password(const store::ShardStore& store, std::string_view password);

} // namespace cli
} // namespace hashrange
