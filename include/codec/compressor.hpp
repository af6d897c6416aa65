#ifndef HASHRANGE_COMPRESSOR_HPP
#define HASHRANGE_COMPRESSOR_HPP

#include <string>
#include <string_view>
#include "codec/compression_error.hpp"

namespace hashrange::codec {

// zlib level used for .json.gz artifacts
constexpr int GZIP_BEST_COMPRESSION = 9;

// ---- ENCODERS ----
// Compresses input into a single gzip member (RFC 1952)
std::string gzip_compress(std::string_view input, int level = GZIP_BEST_COMPRESSION);
// Compresses input with the Brotli encoder's default quality, window and mode
std::string brotli_compress(std::string_view input);


// ---- DECODERS ----
std::string gzip_decompress(std::string_view input);
std::string brotli_decompress(std::string_view input);

} // namespace hashrange::codec

#endif // HASHRANGE_COMPRESSOR_HPP
