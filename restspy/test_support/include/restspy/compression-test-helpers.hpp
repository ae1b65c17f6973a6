#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace restspy::test {

// Encoders used by tests to build compressed payloads. Each returns an empty string when the corresponding codec
// is not compiled in.

// variant: "gzip", "zlib" (RFC 1950 wrapper, what most servers send for Content-Encoding: deflate) or "raw"
std::string ZlibCompress(std::string_view input, std::string_view variant);

std::string BrotliCompress(std::string_view input);

// When pledgeSize is false the frame does not carry its content size, forcing streaming decompression.
std::string ZstdCompress(std::string_view input, bool pledgeSize = true);

// Deterministic, moderately compressible payload.
std::string MakePatternedPayload(std::size_t size);

}  // namespace restspy::test
