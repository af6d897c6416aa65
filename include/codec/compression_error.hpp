#ifndef HASHRANGE_COMPRESSION_ERROR_HPP
#define HASHRANGE_COMPRESSION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace hashrange::codec {

class CompressionError : public std::runtime_error {
public:
    explicit CompressionError(const std::string& message)
        : std::runtime_error(message) {}
};

class GzipError : public CompressionError {
public:
    explicit GzipError(const std::string& message)
        : CompressionError("Gzip error: " + message) {}
};

class BrotliError : public CompressionError {
public:
    explicit BrotliError(const std::string& message)
        : CompressionError("Brotli error: " + message) {}
};

} // namespace hashrange::codec

#endif // HASHRANGE_COMPRESSION_ERROR_HPP
