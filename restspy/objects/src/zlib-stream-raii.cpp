#include "restspy/zlib-stream-raii.hpp"

#include <zconf.h>
#include <zlib.h>

#include <format>
#include <stdexcept>

#include "restspy/log.hpp"

namespace restspy {

namespace {
constexpr int ComputeWindowBits(ZStreamRAII::Variant variant) {
  switch (variant) {
    case ZStreamRAII::Variant::gzip:
      return MAX_WBITS + 16;
    case ZStreamRAII::Variant::zlib:
      return MAX_WBITS;
    case ZStreamRAII::Variant::rawDeflate:
      return -MAX_WBITS;
    default:
      throw std::invalid_argument("Invalid zlib variant");
  }
}
}  // namespace

ZStreamRAII::ZStreamRAII(Variant variant) {
  const auto ret = inflateInit2(&stream, ComputeWindowBits(variant));
  if (ret != Z_OK) {
    throw std::runtime_error(std::format("Error from inflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = inflateEnd(&stream);
  if (ret != Z_OK) {
    log::error("zlib: inflateEnd returned {} (ignored)", ret);
  }
}

}  // namespace restspy
