#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "restspy/http-client.hpp"
#include "restspy/http-headers.hpp"
#include "restspy/server-result.hpp"
#include "restspy/url.hpp"

namespace restspy {

// A rest-spy server instance reachable at baseUrl(). Endpoints given to get, post and del are resolved against it.
class Server {
 public:
  Server(const Server&) = delete;
  Server(Server&&) noexcept = delete;
  Server& operator=(const Server&) = delete;
  Server& operator=(Server&&) noexcept = delete;

  virtual ~Server();

  virtual ServerResult start() = 0;

  virtual void stop() = 0;

  // GET baseUrl + endpoint. Succeeds with the raw body only if the status code is exactly 200.
  ServerResult get(std::string_view endpoint);

  // POST baseUrl + endpoint. The response is returned whatever its status code.
  HttpClientResult post(std::string_view endpoint, std::string data, http::Headers headers = {});

  // DELETE baseUrl + endpoint. The response is returned whatever its status code.
  HttpClientResult del(std::string_view endpoint);

  [[nodiscard]] const Url& baseUrl() const noexcept { return _baseUrl; }

 protected:
  // Throws restspy::invalid_argument if httpClient is null.
  Server(Url baseUrl, std::unique_ptr<HttpClient> httpClient);

  HttpClient& httpClient() noexcept { return *_httpClient; }

 private:
  Url _baseUrl;
  std::unique_ptr<HttpClient> _httpClient;
};

// Server error corresponding to a failed HTTP client call.
ServerResult::Error ToServerError(HttpClientResult::Error error);

}  // namespace restspy
