#ifndef HASHRANGE_STORE_ERROR_HPP
#define HASHRANGE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace hashrange {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message)
    : std::runtime_error(message) {}
};

// Raised when a range key fails validation (wrong length or non-hex byte)
class InvalidKeyError : public StoreError {
public:
  explicit InvalidKeyError(const std::string& message)
    : StoreError("Invalid range key: " + message) {}
};

} // namespace store
} // namespace hashrange

#endif // HASHRANGE_STORE_ERROR_HPP
