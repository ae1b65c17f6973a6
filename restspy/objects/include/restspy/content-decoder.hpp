#pragma once

#include <string>
#include <string_view>

#include "restspy/decoding-config.hpp"

namespace restspy {

class ContentDecoder {
 public:
  ContentDecoder() noexcept = delete;

  // Undo the content-codings listed in 'contentEncoding' (value of a Content-Encoding header, codings listed in the
  // order they were applied) and return the plain body.
  // The body is returned unchanged when contentEncoding is empty or only lists 'identity', when a coding is unknown
  // or not compiled in, or when a decoder fails or exceeds the configured limits. Never throws on bad input.
  static std::string Decode(std::string_view body, std::string_view contentEncoding, const DecodingConfig& config = {});
};

}  // namespace restspy
