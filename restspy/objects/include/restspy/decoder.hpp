#pragma once

#include <cstddef>
#include <string_view>

#include "restspy/raw-chars.hpp"

namespace restspy {

// Full-buffer decoder of one content-coding.
// Implementations are not thread-safe.
class Decoder {
 public:
  virtual ~Decoder() = default;

  // Decode 'input' and append the plain bytes to 'out'.
  // Returns true on success, false on failure (corrupt or truncated input, trailing garbage, or exceeding
  // maxDecompressedBytes, 0 meaning no limit).
  virtual bool decompressFull(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                              RawChars& out) = 0;
};

}  // namespace restspy
