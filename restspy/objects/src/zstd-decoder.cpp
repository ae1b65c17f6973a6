#include "restspy/zstd-decoder.hpp"

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <new>
#include <string_view>

#include "decoder-helpers.hpp"
#include "restspy/log.hpp"
#include "restspy/raw-chars.hpp"

namespace restspy {

namespace {

bool StreamingDecompress(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                         RawChars& out) {
  std::unique_ptr<ZSTD_DStream, decltype(&ZSTD_freeDStream)> stream{ZSTD_createDStream(), &ZSTD_freeDStream};
  if (!stream) {
    throw std::bad_alloc();
  }
  ZSTD_initDStream(stream.get());

  DecoderBufferManager decoderBufferManager(out, decoderChunkSize, maxDecompressedBytes);

  ZSTD_inBuffer in{input.data(), input.size(), 0};
  while (true) {
    const bool forceEnd = decoderBufferManager.nextReserve();
    ZSTD_outBuffer output{out.data() + out.size(), out.availableCapacity(), 0};
    const std::size_t ret = ZSTD_decompressStream(stream.get(), &output, &in);
    if (ZSTD_isError(ret) != 0U) [[unlikely]] {
      log::debug("ZstdDecoder - ZSTD_decompressStream failed with error {}", ZSTD_getErrorName(ret));
      return false;
    }
    out.addSize(output.pos);
    if (ret == 0) {
      // End of frame reached.
      return in.pos == in.size;
    }
    if (in.pos == in.size && output.pos < output.size) {
      log::debug("ZstdDecoder - truncated frame");
      return false;
    }
    if (forceEnd) {
      return false;
    }
  }
}

}  // namespace

bool ZstdDecoder::Decompress(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                             RawChars& out) {
  return ZstdDecoder{}.decompressFull(input, maxDecompressedBytes, decoderChunkSize, out);
}

bool ZstdDecoder::decompressFull(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                                 RawChars& out) {
  const auto rSize = ZSTD_getFrameContentSize(input.data(), input.size());
  switch (rSize) {
    case ZSTD_CONTENTSIZE_ERROR:
      log::debug("ZstdDecoder - getFrameContentSize returned ZSTD_CONTENTSIZE_ERROR");
      return false;
    case ZSTD_CONTENTSIZE_UNKNOWN:
      return StreamingDecompress(input, maxDecompressedBytes, decoderChunkSize, out);
    default: {
      if (maxDecompressedBytes != 0 && maxDecompressedBytes < rSize) {
        return false;
      }

      out.ensureAvailableCapacityExponential(rSize);
      const std::size_t ret = ZSTD_decompress(out.data() + out.size(), rSize, input.data(), input.size());
      if (ZSTD_isError(ret) != 0U) [[unlikely]] {
        log::debug("ZstdDecoder - ZSTD_decompress failed with error {}", ZSTD_getErrorName(ret));
        return false;
      }

      out.addSize(ret);
      return true;
    }
  }
}

}  // namespace restspy
