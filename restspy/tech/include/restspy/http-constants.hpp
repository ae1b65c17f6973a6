#pragma once

#include <string_view>

namespace restspy::http {

// Header names are stored in their canonical form for emission; lookups must stay case-insensitive.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view DELETE = "DELETE";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view Host = "Host";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

// Content codings
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view xgzip = "x-gzip";
inline constexpr std::string_view deflate = "deflate";
inline constexpr std::string_view br = "br";
inline constexpr std::string_view zstd = "zstd";
inline constexpr std::string_view identity = "identity";

}  // namespace restspy::http
