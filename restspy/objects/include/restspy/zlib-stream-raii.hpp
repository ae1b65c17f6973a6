#pragma once

#include <zlib.h>

#include <cstdint>

namespace restspy {

// Owns a z_stream initialized for inflation.
struct ZStreamRAII {
  // rawDeflate: headerless deflate stream (RFC 1951), sent by some servers for "Content-Encoding: deflate".
  enum class Variant : int8_t { gzip, zlib, rawDeflate };

  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(Variant variant);

  // z_stream is not moveable or copyable - delete these operations
  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

}  // namespace restspy
