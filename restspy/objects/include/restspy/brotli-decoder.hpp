#pragma once

#include <cstddef>
#include <string_view>

#include "restspy/decoder.hpp"
#include "restspy/raw-chars.hpp"

namespace restspy {

class BrotliDecoder : public Decoder {
 public:
  // Decompresses full brotli-encoded input into out. Returns true on success; false on error or size guard.
  static bool Decompress(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                         RawChars& out);

  bool decompressFull(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                      RawChars& out) override;
};

}  // namespace restspy
