#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "restspy/decoding-config.hpp"
#include "restspy/double.hpp"
#include "restspy/http-headers.hpp"
#include "restspy/http-status-code.hpp"

namespace restspy {

// Outcome of serving one request: proxied from upstream, taken from a double, or not found.
// Immutable once constructed. The decoded body is computed at construction.
class Response {
 public:
  enum class Type : std::uint8_t { proxy, testDouble, notFound };

  // Serializable projection of a Response.
  struct Representation {
    std::string type;
    http::StatusCode statusCode;
    std::string body;

    bool operator==(const Representation&) const noexcept = default;
  };

  // Wraps an upstream response. 'body' is the raw body, as received (possibly content-encoded).
  static Response Proxy(http::StatusCode statusCode, http::Headers headers, std::string body,
                        const DecodingConfig& decodingConfig = {});

  // Canned response configured by 'testDouble'.
  static Response FromDouble(const Double& testDouble, const DecodingConfig& decodingConfig = {});

  // 404 with no headers and an empty body.
  static Response NotFound();

  [[nodiscard]] Type type() const noexcept { return _type; }

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::string_view decodedBody() const noexcept { return _decodedBody; }

  [[nodiscard]] Representation toRepresentation() const;

#ifdef RESTSPY_ENABLE_GLAZE
  // {"type":...,"status_code":...,"body":...}
  [[nodiscard]] std::string toJson() const;
#endif

  bool operator==(const Response&) const noexcept = default;

 private:
  Response(Type type, http::StatusCode statusCode, http::Headers headers, std::string body,
           const DecodingConfig& decodingConfig);

  http::Headers _headers;
  std::string _body;
  std::string _decodedBody;
  http::StatusCode _statusCode;
  Type _type;
};

// "proxy", "double" or "not_found".
std::string_view TypeStr(Response::Type type);

}  // namespace restspy
