#include "restspy/response.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "restspy/content-decoder.hpp"
#include "restspy/decoding-config.hpp"
#include "restspy/double.hpp"
#include "restspy/http-constants.hpp"
#include "restspy/http-headers.hpp"
#include "restspy/http-status-code.hpp"

#ifdef RESTSPY_ENABLE_GLAZE
#include "restspy/json-serializer.hpp"

template <>
struct glz::meta<restspy::Response::Representation> {
  using T = restspy::Response::Representation;
  static constexpr auto value = glz::object("type", &T::type, "status_code", &T::statusCode, "body", &T::body);
};
#endif

namespace restspy {

Response::Response(Type type, http::StatusCode statusCode, http::Headers headers, std::string body,
                   const DecodingConfig& decodingConfig)
    : _headers(std::move(headers)), _body(std::move(body)), _statusCode(statusCode), _type(type) {
  if (_headers.empty()) {
    _decodedBody = _body;
  } else {
    _decodedBody = ContentDecoder::Decode(_body, http::FindHeader(_headers, http::ContentEncoding).value_or(""),
                                          decodingConfig);
  }
}

Response Response::Proxy(http::StatusCode statusCode, http::Headers headers, std::string body,
                         const DecodingConfig& decodingConfig) {
  return {Type::proxy, statusCode, std::move(headers), std::move(body), decodingConfig};
}

Response Response::FromDouble(const Double& testDouble, const DecodingConfig& decodingConfig) {
  return {Type::testDouble, testDouble.statusCode(), testDouble.headers(), std::string(testDouble.body()),
          decodingConfig};
}

Response Response::NotFound() { return {Type::notFound, http::StatusCodeNotFound, {}, {}, DecodingConfig{}}; }

Response::Representation Response::toRepresentation() const {
  return {std::string(TypeStr(_type)), _statusCode, _decodedBody};
}

#ifdef RESTSPY_ENABLE_GLAZE
std::string Response::toJson() const { return SerializeToJson(toRepresentation()); }
#endif

std::string_view TypeStr(Response::Type type) {
  switch (type) {
    case Response::Type::proxy:
      return "proxy";
    case Response::Type::testDouble:
      return "double";
    case Response::Type::notFound:
      return "not_found";
    default:
      return "unknown";
  }
}

}  // namespace restspy
