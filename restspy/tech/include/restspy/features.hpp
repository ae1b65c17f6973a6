#pragma once

namespace restspy {

#ifdef RESTSPY_ENABLE_SPDLOG
constexpr bool spdLogEnabled() { return true; }
#else
constexpr bool spdLogEnabled() { return false; }
#endif

#ifdef RESTSPY_ENABLE_ZLIB
constexpr bool zlibEnabled() { return true; }
#else
constexpr bool zlibEnabled() { return false; }
#endif

#ifdef RESTSPY_ENABLE_ZSTD
constexpr bool zstdEnabled() { return true; }
#else
constexpr bool zstdEnabled() { return false; }
#endif

#ifdef RESTSPY_ENABLE_BROTLI
constexpr bool brotliEnabled() { return true; }
#else
constexpr bool brotliEnabled() { return false; }
#endif

#ifdef RESTSPY_ENABLE_GLAZE
constexpr bool glazeEnabled() { return true; }
#else
constexpr bool glazeEnabled() { return false; }
#endif

}  // namespace restspy
