#include "store/path_codec.hpp"
#include <sstream>

namespace hashrange {
namespace store {

//==============================================
// HEX HELPERS
//==============================================

char hex_digit(unsigned value) {
  static constexpr char digits[] = "0123456789ABCDEF";
  return digits[value & 0x0F];
}

char canonical_hex(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c;
  }
  if (c >= 'A' && c <= 'F') {
    return c;
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<char>(c - 'a' + 'A');
  }
  return '\0';
}

RangeKey key_from_index(std::uint32_t index) {
  if (index >= KEYSPACE_SIZE) {
    throw InvalidKeyError("index " + std::to_string(index) + " is outside the keyspace");
  }

  std::string value(RANGE_KEY_LENGTH, '0');
  for (std::size_t i = RANGE_KEY_LENGTH; i > 0; --i) {
    value[i - 1] = hex_digit(index & 0x0F);
    index >>= 4;
  }
  return decode(value);
}


//==============================================
// PATH CODEC
//==============================================

RangeKey decode(std::string_view input) {
  if (input.size() != RANGE_KEY_LENGTH) {
    throw InvalidKeyError("expected " + std::to_string(RANGE_KEY_LENGTH) +
                          " characters, got " + std::to_string(input.size()));
  }

  std::string canonical(RANGE_KEY_LENGTH, '0');
  for (std::size_t i = 0; i < input.size(); ++i) {
    char c = canonical_hex(input[i]);
    if (c == '\0') {
      std::ostringstream msg;
      msg << "byte 0x" << hex_digit(static_cast<unsigned char>(input[i]) >> 4)
          << hex_digit(static_cast<unsigned char>(input[i]))
          << " at position " << i << " is not an ascii hex character";
      throw InvalidKeyError(msg.str());
    }
    canonical[i] = c;
  }

  return RangeKey(std::move(canonical));
}

std::filesystem::path encode(const RangeKey& key) {
  std::filesystem::path path;
  for (std::size_t i = 0; i < RANGE_KEY_LENGTH; ++i) {
    path /= std::string(1, key[i]);
  }
  return path;
}

bool is_valid_key(std::string_view input) noexcept {
  if (input.size() != RANGE_KEY_LENGTH) {
    return false;
  }
  for (char c : input) {
    if (canonical_hex(c) == '\0') {
      return false;
    }
  }
  return true;
}

} // namespace store
} // namespace hashrange
