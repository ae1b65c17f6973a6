#include "restspy/zlib-decoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <string_view>

#include "decoder-helpers.hpp"
#include "restspy/log.hpp"
#include "restspy/raw-chars.hpp"
#include "restspy/zlib-stream-raii.hpp"

namespace restspy {

namespace {

bool Inflate(ZStreamRAII::Variant variant, std::string_view input, std::size_t maxDecompressedBytes,
             std::size_t decoderChunkSize, RawChars& out) {
  ZStreamRAII context(variant);
  auto& stream = context.stream;

  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());

  DecoderBufferManager decoderBufferManager(out, decoderChunkSize, maxDecompressedBytes);

  while (true) {
    const bool forceEnd = decoderBufferManager.nextReserve();

    stream.avail_out = static_cast<uInt>(out.availableCapacity());
    stream.next_out = reinterpret_cast<unsigned char*>(out.data() + out.size());

    const auto ret = inflate(&stream, Z_NO_FLUSH);
    out.setSize(out.capacity() - stream.avail_out);
    if (ret == Z_STREAM_END) {
      return stream.avail_in == 0;
    }
    if (ret != Z_OK) {
      log::debug("ZlibDecoder - inflate failed with error {}", ret);
      return false;
    }
    if (stream.avail_in == 0 && stream.avail_out != 0) {
      log::debug("ZlibDecoder - truncated stream");
      return false;
    }
    if (forceEnd) {
      log::debug("ZlibDecoder - reached max decompressed size of {}", maxDecompressedBytes);
      return false;
    }
  }
}

}  // namespace

bool ZlibDecoder::Decompress(std::string_view input, bool isGzip, std::size_t maxDecompressedBytes,
                             std::size_t decoderChunkSize, RawChars& out) {
  if (isGzip) {
    return Inflate(ZStreamRAII::Variant::gzip, input, maxDecompressedBytes, decoderChunkSize, out);
  }
  const auto initialSize = out.size();
  if (Inflate(ZStreamRAII::Variant::zlib, input, maxDecompressedBytes, decoderChunkSize, out)) {
    return true;
  }
  out.setSize(initialSize);
  return Inflate(ZStreamRAII::Variant::rawDeflate, input, maxDecompressedBytes, decoderChunkSize, out);
}

bool ZlibDecoder::decompressFull(std::string_view input, std::size_t maxDecompressedBytes, std::size_t decoderChunkSize,
                                 RawChars& out) {
  return Decompress(input, _isGzip, maxDecompressedBytes, decoderChunkSize, out);
}

}  // namespace restspy
