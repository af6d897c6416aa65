#include "codec/compressor.hpp"
#include <cstdint>
#include <cstring>
#include <zlib.h>
#include <brotli/decode.h>
#include <brotli/encode.h>
#include <boost/log/trivial.hpp>

namespace hashrange::codec {

namespace {

constexpr std::size_t BUFFER_SIZE = 16384;

// windowBits + 16 selects the gzip wrapper instead of raw zlib
constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;

//==============================================
// RAII WRAPPERS FOR ENCODER/DECODER STATE
//==============================================

struct DeflateContext {
  z_stream strm;

  explicit DeflateContext(int level) {
    std::memset(&strm, 0, sizeof(strm));
    int ret = deflateInit2(&strm, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
      throw GzipError("deflateInit2 failed with code " + std::to_string(ret));
    }
  }

  ~DeflateContext() { deflateEnd(&strm); }

  DeflateContext(const DeflateContext&) = delete;
  DeflateContext& operator=(const DeflateContext&) = delete;
};

struct InflateContext {
  z_stream strm;

  InflateContext() {
    std::memset(&strm, 0, sizeof(strm));
    int ret = inflateInit2(&strm, GZIP_WINDOW_BITS);
    if (ret != Z_OK) {
      throw GzipError("inflateInit2 failed with code " + std::to_string(ret));
    }
  }

  ~InflateContext() { inflateEnd(&strm); }

  InflateContext(const InflateContext&) = delete;
  InflateContext& operator=(const InflateContext&) = delete;
};

struct BrotliDecoderContext {
  BrotliDecoderState* state = nullptr;

  BrotliDecoderContext() {
    state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
      throw BrotliError("Failed to create decoder instance");
    }
  }

  ~BrotliDecoderContext() {
    if (state) {
      BrotliDecoderDestroyInstance(state);
    }
  }

  BrotliDecoderContext(const BrotliDecoderContext&) = delete;
  BrotliDecoderContext& operator=(const BrotliDecoderContext&) = delete;

  BrotliDecoderState* get() { return state; }
};

} // namespace


//==============================================
// ENCODERS
//==============================================

std::string gzip_compress(std::string_view input, int level) {
  DeflateContext ctx(level);

  std::string output;
  output.resize(deflateBound(&ctx.strm, static_cast<uLong>(input.size())));

  ctx.strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  ctx.strm.avail_in = static_cast<uInt>(input.size());

  // deflateBound guarantees a single Z_FINISH call completes the stream
  int ret = Z_OK;
  while (ret == Z_OK) {
    if (ctx.strm.total_out == output.size()) {
      output.resize(output.size() * 2);
    }
    ctx.strm.next_out = reinterpret_cast<Bytef*>(&output[ctx.strm.total_out]);
    ctx.strm.avail_out = static_cast<uInt>(output.size() - ctx.strm.total_out);
    ret = deflate(&ctx.strm, Z_FINISH);
  }

  if (ret != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Compressor: deflate failed with code " << ret;
    throw GzipError("deflate failed with code " + std::to_string(ret));
  }

  output.resize(ctx.strm.total_out);
  return output;
}

std::string brotli_compress(std::string_view input) {
  std::size_t encoded_size = BrotliEncoderMaxCompressedSize(input.size());
  if (encoded_size == 0) {
    throw BrotliError("Input of " + std::to_string(input.size()) + " bytes is too large");
  }

  std::string output(encoded_size, '\0');
  BROTLI_BOOL ok = BrotliEncoderCompress(
    BROTLI_DEFAULT_QUALITY,
    BROTLI_DEFAULT_WINDOW,
    BROTLI_DEFAULT_MODE,
    input.size(),
    reinterpret_cast<const std::uint8_t*>(input.data()),
    &encoded_size,
    reinterpret_cast<std::uint8_t*>(&output[0]));

  if (!ok) {
    BOOST_LOG_TRIVIAL(error) << "Compressor: Brotli encoding failed for " << input.size() << " bytes";
    throw BrotliError("Encoding failed");
  }

  output.resize(encoded_size);
  return output;
}


//==============================================
// DECODERS
//==============================================

std::string gzip_decompress(std::string_view input) {
  InflateContext ctx;

  ctx.strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  ctx.strm.avail_in = static_cast<uInt>(input.size());

  std::string output;
  char buffer[BUFFER_SIZE];

  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    ctx.strm.next_out = reinterpret_cast<Bytef*>(buffer);
    ctx.strm.avail_out = sizeof(buffer);

    ret = inflate(&ctx.strm, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      throw GzipError("inflate failed with code " + std::to_string(ret));
    }

    std::size_t produced = sizeof(buffer) - ctx.strm.avail_out;
    output.append(buffer, produced);

    // No progress possible: input exhausted before the end of the stream
    if (ret == Z_OK && produced == 0 && ctx.strm.avail_in == 0) {
      throw GzipError("Truncated gzip stream");
    }
  }

  return output;
}

std::string brotli_decompress(std::string_view input) {
  BrotliDecoderContext ctx;

  std::size_t available_in = input.size();
  const std::uint8_t* next_in = reinterpret_cast<const std::uint8_t*>(input.data());

  std::string output;
  std::uint8_t buffer[BUFFER_SIZE];

  BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
  while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
    std::size_t available_out = sizeof(buffer);
    std::uint8_t* next_out = buffer;

    result = BrotliDecoderDecompressStream(ctx.get(), &available_in, &next_in,
                                           &available_out, &next_out, nullptr);
    output.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - available_out);
  }

  if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
    throw BrotliError("Truncated brotli stream");
  }
  if (result != BROTLI_DECODER_RESULT_SUCCESS) {
    throw BrotliError(BrotliDecoderErrorString(BrotliDecoderGetErrorCode(ctx.get())));
  }

  return output;
}

} // namespace hashrange::codec
