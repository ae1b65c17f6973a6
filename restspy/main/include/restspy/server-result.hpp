#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "restspy/http-status-code.hpp"

namespace restspy {

// Outcome of a server operation: success (with the response body for 'get'), or an error kind.
// For HttpStatus errors, statusCode() and body() hold the unexpected response.
class [[nodiscard]] ServerResult {
 public:
  enum class Error : std::int8_t {
    None,
    DuplicatePort,
    Timeout,
    HttpStatus,
    ConnectionFailure,
    InvalidResponse,
    SpawnFailure
  };

  ServerResult() noexcept = default;

  explicit ServerResult(Error error, http::StatusCode statusCode = 0, std::string body = {})
      : _body(std::move(body)), _statusCode(statusCode), _error(error) {}

  static ServerResult Success(http::StatusCode statusCode, std::string body) {
    return ServerResult(Error::None, statusCode, std::move(body));
  }

  [[nodiscard]] bool hasError() const noexcept { return _error != Error::None; }

  [[nodiscard]] Error error() const noexcept { return _error; }

  // Status code of the last received HTTP response, 0 if none.
  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  explicit operator bool() const noexcept { return !hasError(); }

 private:
  std::string _body;
  http::StatusCode _statusCode{0};
  Error _error{Error::None};
};

std::string_view ErrorStr(ServerResult::Error error);

}  // namespace restspy
