#include "restspy/decoding-config.hpp"

#include <cstddef>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

void DecodingConfig::validate() const {
  if (decoderChunkSize == 0) {
    throw invalid_argument("decoderChunkSize must be > 0");
  }
  if (maxDecodedBytes != 0 && maxDecodedBytes < decoderChunkSize) {
    throw invalid_argument("maxDecodedBytes must be >= decoderChunkSize");
  }
}

DecodingConfig& DecodingConfig::withMaxDecodedBytes(std::size_t maxDecodedBytes) {
  this->maxDecodedBytes = maxDecodedBytes;
  return *this;
}

DecodingConfig& DecodingConfig::withDecoderChunkSize(std::size_t decoderChunkSize) {
  this->decoderChunkSize = decoderChunkSize;
  return *this;
}

}  // namespace restspy
