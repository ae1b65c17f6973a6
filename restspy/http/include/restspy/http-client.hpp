#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "restspy/http-headers.hpp"
#include "restspy/http-status-code.hpp"
#include "restspy/url.hpp"

namespace restspy {

struct HttpClientRequest {
  std::string_view method;
  Url url;
  http::Headers headers;
  std::string body;
};

struct HttpClientResponse {
  http::StatusCode statusCode{0};
  std::string reason;
  http::Headers headers;
  std::string body;  // de-chunked but not content-decoded
};

// Outcome of HttpClient::perform: a response with any status code, or the reason why none was obtained.
class HttpClientResult {
 public:
  enum class Error : std::int8_t {
    None,
    ConnectionFailure,  // name resolution, refused or reset connection, peer closed without answering
    Timeout,            // connected but no complete response within the receive timeout
    InvalidResponse     // malformed or oversized response
  };

  HttpClientResult(HttpClientResponse response) : _response(std::move(response)) {}  // NOLINT(google-explicit-constructor)

  explicit HttpClientResult(Error error) noexcept : _error(error) {}

  [[nodiscard]] bool hasError() const noexcept { return _error != Error::None; }

  [[nodiscard]] Error error() const noexcept { return _error; }

  explicit operator bool() const noexcept { return !hasError(); }

  // Only meaningful when !hasError().
  HttpClientResponse& operator*() noexcept { return _response; }
  const HttpClientResponse& operator*() const noexcept { return _response; }
  HttpClientResponse* operator->() noexcept { return &_response; }
  const HttpClientResponse* operator->() const noexcept { return &_response; }

 private:
  HttpClientResponse _response;
  Error _error{Error::None};
};

std::string_view ErrorStr(HttpClientResult::Error error);

// Blocking HTTP client used by servers to talk to their backing instance.
// Implementations must be usable from several threads concurrently.
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  // Perform one request. Any received status code is a success.
  virtual HttpClientResult perform(const HttpClientRequest& request) = 0;
};

}  // namespace restspy
