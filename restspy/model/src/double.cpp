#include "restspy/double.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "restspy/http-headers.hpp"
#include "restspy/http-status-code.hpp"
#include "restspy/invalid_argument_exception.hpp"
#include "restspy/matchable.hpp"

namespace restspy {

namespace {
http::StatusCode CheckStatusCode(http::StatusCode statusCode) {
  if (statusCode < 100 || statusCode > 999) {
    throw invalid_argument("Invalid status code {}", statusCode);
  }
  return statusCode;
}
}  // namespace

Double::Double(std::string_view pattern, http::StatusCode statusCode, http::Headers headers, std::string body)
    : Matchable(pattern), _headers(std::move(headers)), _body(std::move(body)), _statusCode(CheckStatusCode(statusCode)) {}

Double::Double(std::string id, std::string_view pattern, http::StatusCode statusCode, http::Headers headers,
               std::string body)
    : Matchable(std::move(id), pattern),
      _headers(std::move(headers)),
      _body(std::move(body)),
      _statusCode(CheckStatusCode(statusCode)) {}

}  // namespace restspy
