#pragma once

#include "restspy/http-client-config.hpp"
#include "restspy/http-client.hpp"

namespace restspy {

// HttpClient implementation opening one plain TCP connection per request.
// The request is sent with 'Connection: close' and the response is read until the peer closes.
class SocketHttpClient : public HttpClient {
 public:
  SocketHttpClient() = default;

  // Throws invalid_argument if config is invalid.
  explicit SocketHttpClient(HttpClientConfig config);

  HttpClientResult perform(const HttpClientRequest& request) override;

  [[nodiscard]] const HttpClientConfig& config() const noexcept { return _config; }

 private:
  HttpClientConfig _config;
};

}  // namespace restspy
