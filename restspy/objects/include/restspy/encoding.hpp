#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "restspy/features.hpp"
#include "restspy/http-constants.hpp"
#include "restspy/string-equal-ignore-case.hpp"

namespace restspy {

enum class Encoding : std::uint8_t {
  zstd,
  br,
  gzip,
  deflate,
  none,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  static constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
      http::zstd, http::br, http::gzip, http::deflate, http::identity,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Check if encoding is enabled in this build.
constexpr bool IsEncodingEnabled(Encoding enc) {
  static constexpr bool kEncodingEnabled[kNbContentEncodings] = {
      zstdEnabled(), brotliEnabled(), zlibEnabled(), zlibEnabled(), true,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return false;
  }
  return kEncodingEnabled[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Map a single (already trimmed) content-coding token to its Encoding, case-insensitively.
// 'x-gzip' is an alias of 'gzip' (RFC 9110 §8.4.1.3). Returns std::nullopt for unknown codings.
constexpr std::optional<Encoding> ParseEncoding(std::string_view token) {
  if (CaseInsensitiveEqual(token, http::gzip) || CaseInsensitiveEqual(token, http::xgzip)) {
    return Encoding::gzip;
  }
  if (CaseInsensitiveEqual(token, http::deflate)) {
    return Encoding::deflate;
  }
  if (CaseInsensitiveEqual(token, http::br)) {
    return Encoding::br;
  }
  if (CaseInsensitiveEqual(token, http::zstd)) {
    return Encoding::zstd;
  }
  if (CaseInsensitiveEqual(token, http::identity)) {
    return Encoding::none;
  }
  return std::nullopt;
}

}  // namespace restspy
