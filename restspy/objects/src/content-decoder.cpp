#include "restspy/content-decoder.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "restspy/decoder.hpp"
#include "restspy/decoding-config.hpp"
#include "restspy/encoding.hpp"
#include "restspy/log.hpp"
#include "restspy/raw-chars.hpp"
#include "restspy/string-trim.hpp"

#ifdef RESTSPY_ENABLE_ZLIB
#include "restspy/zlib-decoder.hpp"
#endif
#ifdef RESTSPY_ENABLE_BROTLI
#include "restspy/brotli-decoder.hpp"
#endif
#ifdef RESTSPY_ENABLE_ZSTD
#include "restspy/zstd-decoder.hpp"
#endif

namespace restspy {

namespace {

// Splits the comma separated list of codings, skipping empty and 'identity' tokens.
// Returns std::nullopt if one of the codings cannot be decoded by this build.
std::optional<std::vector<Encoding>> ParseCodings(std::string_view contentEncoding) {
  std::vector<Encoding> codings;
  while (!contentEncoding.empty()) {
    const auto commaPos = contentEncoding.find(',');
    const auto token = TrimOws(contentEncoding.substr(0, commaPos));
    contentEncoding.remove_prefix(commaPos == std::string_view::npos ? contentEncoding.size() : commaPos + 1);
    if (token.empty()) {
      continue;
    }
    const auto encoding = ParseEncoding(token);
    if (!encoding) {
      log::warn("Unknown content-coding '{}', body left undecoded", token);
      return std::nullopt;
    }
    if (*encoding == Encoding::none) {
      continue;
    }
    if (!IsEncodingEnabled(*encoding)) {
      log::warn("Content-coding '{}' is not supported by this build, body left undecoded", token);
      return std::nullopt;
    }
    codings.push_back(*encoding);
  }
  return codings;
}

std::unique_ptr<Decoder> MakeDecoder(Encoding encoding) {
  switch (encoding) {
#ifdef RESTSPY_ENABLE_ZLIB
    case Encoding::gzip:
      return std::make_unique<ZlibDecoder>(true);
    case Encoding::deflate:
      return std::make_unique<ZlibDecoder>(false);
#endif
#ifdef RESTSPY_ENABLE_BROTLI
    case Encoding::br:
      return std::make_unique<BrotliDecoder>();
#endif
#ifdef RESTSPY_ENABLE_ZSTD
    case Encoding::zstd:
      return std::make_unique<ZstdDecoder>();
#endif
    default:
      return nullptr;
  }
}

}  // namespace

std::string ContentDecoder::Decode(std::string_view body, std::string_view contentEncoding,
                                   const DecodingConfig& config) {
  const auto codings = ParseCodings(contentEncoding);
  if (!codings || codings->empty()) {
    return std::string(body);
  }

  RawChars current(body);
  RawChars decoded;
  // Codings are listed in the order they were applied, undo them from the last one.
  for (auto it = codings->rbegin(); it != codings->rend(); ++it) {
    decoded.clear();
    const auto decoder = MakeDecoder(*it);
    if (!decoder || !decoder->decompressFull(current, config.maxDecodedBytes, config.decoderChunkSize, decoded)) {
      log::error("Unable to decode body of {} bytes with content-coding '{}', body left undecoded", body.size(),
                 GetEncodingStr(*it));
      return std::string(body);
    }
    swap(current, decoded);
  }
  return std::string(std::string_view(current));
}

}  // namespace restspy
