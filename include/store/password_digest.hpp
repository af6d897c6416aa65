#pragma once

#include <string>
#include <string_view>
#include "store/path_codec.hpp"

namespace hashrange {
namespace store {

// Number of hex characters in a full SHA-1 identifier and in the per-shard suffix
constexpr std::size_t FULL_HASH_LENGTH = 40;
constexpr std::size_t SUFFIX_LENGTH = FULL_HASH_LENGTH - RANGE_KEY_LENGTH;

struct PasswordDigest {
  RangeKey key;
  std::string suffix;

  // key + suffix, 40 upper case hex characters
  std::string full_hash() const { return key.str() + suffix; }
};

// Upper case hex SHA-1 of the input, computed through OpenSSL EVP
std::string sha1_hex(std::string_view text);
// Splits the SHA-1 of a password into its range key and suffix
PasswordDigest digest_password(std::string_view password);

} // namespace store
} // namespace hashrange
