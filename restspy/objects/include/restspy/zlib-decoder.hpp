#pragma once

#include <cstddef>
#include <string_view>

#include "restspy/decoder.hpp"
#include "restspy/raw-chars.hpp"

namespace restspy {

// Full-buffer inflate for the gzip and deflate content-codings.
class ZlibDecoder : public Decoder {
 public:
  explicit ZlibDecoder(bool isGzip) : _isGzip(isGzip) {}

  // Returns true on success; false if inflate fails or limits are exceeded. Output appended to out.
  // When isGzip is false, both zlib-wrapped (RFC 1950) and raw deflate (RFC 1951) streams are accepted.
  static bool Decompress(std::string_view input, bool isGzip, std::size_t maxDecompressedBytes,
                         std::size_t decoderChunkSize, RawChars& out);

  bool decompressFull(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                      RawChars& out) override;

 private:
  bool _isGzip{false};
};

}  // namespace restspy
