#include "restspy/brotli-decoder.hpp"

#include <brotli/decode.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <string_view>

#include "decoder-helpers.hpp"
#include "restspy/log.hpp"
#include "restspy/raw-chars.hpp"

namespace restspy {

namespace {
using BrotliStateUniquePtr = std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>;
}  // namespace

bool BrotliDecoder::Decompress(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                               RawChars& out) {
  return BrotliDecoder{}.decompressFull(input, maxDecompressedBytes, decoderChunkSize, out);
}

bool BrotliDecoder::decompressFull(std::string_view input, std::size_t maxDecompressedBytes,
                                   std::size_t decoderChunkSize, RawChars& out) {
  BrotliStateUniquePtr state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
  if (!state) {
    throw std::bad_alloc();
  }

  const auto* nextIn = reinterpret_cast<const uint8_t*>(input.data());
  std::size_t availIn = input.size();

  DecoderBufferManager decoderBufferManager(out, decoderChunkSize, maxDecompressedBytes);

  while (true) {
    const bool forceEnd = decoderBufferManager.nextReserve();
    auto* nextOut = reinterpret_cast<uint8_t*>(out.data() + out.size());
    std::size_t availOut = out.availableCapacity();

    const auto res = BrotliDecoderDecompressStream(state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);
    if (res == BROTLI_DECODER_RESULT_ERROR) [[unlikely]] {
      log::debug("BrotliDecoderDecompressStream failed with error code {}",
                 static_cast<int>(BrotliDecoderGetErrorCode(state.get())));
      return false;
    }
    out.setSize(out.capacity() - availOut);
    if (res == BROTLI_DECODER_RESULT_SUCCESS) {
      return availIn == 0;
    }
    if (res == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
      // Whole body was given: the stream is truncated.
      return false;
    }
    // res == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT
    if (forceEnd) {
      return false;
    }
  }
}

}  // namespace restspy
