#include "restspy/compression-test-helpers.hpp"

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>

#ifdef RESTSPY_ENABLE_ZLIB
#include <zlib.h>
#endif
#ifdef RESTSPY_ENABLE_BROTLI
#include <brotli/encode.h>
#endif
#ifdef RESTSPY_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace restspy::test {

std::string ZlibCompress([[maybe_unused]] std::string_view input, [[maybe_unused]] std::string_view variant) {
  std::string out;
#ifdef RESTSPY_ENABLE_ZLIB
  int windowBits = MAX_WBITS;
  if (variant == "gzip") {
    windowBits += 16;
  } else if (variant == "raw") {
    windowBits = -MAX_WBITS;
  }
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  out.resize(deflateBound(&stream, static_cast<uLong>(input.size())) + 32U);
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  const int ret = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (ret != Z_STREAM_END) {
    throw std::runtime_error("deflate did not finish");
  }
  out.resize(stream.total_out);
#endif
  return out;
}

std::string BrotliCompress([[maybe_unused]] std::string_view input) {
  std::string out;
#ifdef RESTSPY_ENABLE_BROTLI
  std::size_t encodedSize = BrotliEncoderMaxCompressedSize(input.size());
  if (encodedSize == 0) {
    encodedSize = input.size() + 1024U;
  }
  out.resize(encodedSize);
  if (BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_GENERIC, input.size(),
                            reinterpret_cast<const uint8_t*>(input.data()), &encodedSize,
                            reinterpret_cast<uint8_t*>(out.data())) == BROTLI_FALSE) {
    throw std::runtime_error("BrotliEncoderCompress failed");
  }
  out.resize(encodedSize);
#endif
  return out;
}

std::string ZstdCompress([[maybe_unused]] std::string_view input, [[maybe_unused]] bool pledgeSize) {
  std::string out;
#ifdef RESTSPY_ENABLE_ZSTD
  out.resize(ZSTD_compressBound(input.size()));
  if (pledgeSize) {
    const std::size_t ret = ZSTD_compress(out.data(), out.size(), input.data(), input.size(), 3);
    if (ZSTD_isError(ret) != 0U) {
      throw std::runtime_error("ZSTD_compress failed");
    }
    out.resize(ret);
    return out;
  }
  ZSTD_CCtx* cctx = ZSTD_createCCtx();
  ZSTD_CCtx_setParameter(cctx, ZSTD_c_contentSizeFlag, 0);
  ZSTD_inBuffer in{input.data(), input.size(), 0};
  ZSTD_outBuffer output{out.data(), out.size(), 0};
  const std::size_t remaining = ZSTD_compressStream2(cctx, &output, &in, ZSTD_e_end);
  ZSTD_freeCCtx(cctx);
  if (ZSTD_isError(remaining) != 0U || remaining != 0) {
    throw std::runtime_error("ZSTD_compressStream2 failed");
  }
  out.resize(output.pos);
#endif
  return out;
}

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.resize_and_overwrite(size, [](char* data, std::size_t size) {
    std::iota(data, data + size, static_cast<unsigned char>(0));
    return size;
  });
  return payload;
}

}  // namespace restspy::test
