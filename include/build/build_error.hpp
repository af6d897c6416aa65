#ifndef HASHRANGE_BUILD_ERROR_HPP
#define HASHRANGE_BUILD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace hashrange {
namespace build {

// Malformed line in an input range file
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string& message)
    : std::runtime_error("Parse error: " + message) {}
};

// An artifact could not be produced or written
class TranscodeError : public std::runtime_error {
public:
  explicit TranscodeError(const std::string& message)
    : std::runtime_error("Transcode error: " + message) {}
};

// The batch as a whole was aborted
class BuildError : public std::runtime_error {
public:
  explicit BuildError(const std::string& message)
    : std::runtime_error("Build error: " + message) {}
};

} // namespace build
} // namespace hashrange

#endif // HASHRANGE_BUILD_ERROR_HPP
