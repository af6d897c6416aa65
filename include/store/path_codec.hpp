#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include "store/store_error.hpp"

namespace hashrange {
namespace store {

// Number of hex characters in a range key
constexpr std::size_t RANGE_KEY_LENGTH = 5;
// Number of nested directory levels (all key characters but the last)
constexpr std::size_t DIRECTORY_DEPTH = RANGE_KEY_LENGTH - 1;
// 16^5 shards and 16^4 leaf directories
constexpr std::uint64_t KEYSPACE_SIZE = 1048576;
constexpr std::uint64_t DIRECTORY_COUNT = 65536;

// Canonical (upper case) five character shard identifier.
// Only constructible through decode(), so every instance is valid.
class RangeKey {
public:
  const std::string& str() const { return value_; }
  char operator[](std::size_t i) const { return value_[i]; }

  bool operator==(const RangeKey& other) const { return value_ == other.value_; }
  bool operator!=(const RangeKey& other) const { return value_ != other.value_; }
  bool operator<(const RangeKey& other) const { return value_ < other.value_; }

private:
  friend RangeKey decode(std::string_view input);
  explicit RangeKey(std::string value) : value_(std::move(value)) {}

  std::string value_;
};


// ---- PATH CODEC ----
// Validates untrusted input and canonicalizes it to upper case.
// Throws InvalidKeyError when the length is not 5 or a byte is outside [0-9A-Fa-f]
RangeKey decode(std::string_view input);
// Maps a key to its relative path: c1/c2/c3/c4/c5 (no extension)
std::filesystem::path encode(const RangeKey& key);
// Returns true if input would decode without error
bool is_valid_key(std::string_view input) noexcept;


// ---- HEX HELPERS ----
// Canonical hex digit for a nibble value in [0, 16)
char hex_digit(unsigned value);
// Upper case hex digit for a valid hex byte, or '\0' if the byte is not hex
char canonical_hex(char c) noexcept;
// Builds the key of the given index in [0, KEYSPACE_SIZE), used for enumerating the keyspace
RangeKey key_from_index(std::uint32_t index);

} // namespace store
} // namespace hashrange
