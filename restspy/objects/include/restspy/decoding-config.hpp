#pragma once

#include <cstddef>

namespace restspy {

// Limits applied when decoding response bodies according to their Content-Encoding.
struct DecodingConfig {
  void validate() const;

  DecodingConfig& withMaxDecodedBytes(std::size_t maxDecodedBytes);

  DecodingConfig& withDecoderChunkSize(std::size_t decoderChunkSize);

  // Absolute cap on the decoded size (in bytes) of a body, all codings included. A body that would decode to more
  // is left undecoded. 0 => no limit. Default: 64 MiB.
  std::size_t maxDecodedBytes{64UL * 1024UL * 1024UL};

  // Minimal chunk size of buffer growths during decompression. The growth is exponential anyway.
  std::size_t decoderChunkSize{16UL * 1024UL};
};

}  // namespace restspy
