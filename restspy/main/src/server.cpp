#include "restspy/server.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "restspy/http-client.hpp"
#include "restspy/http-constants.hpp"
#include "restspy/http-headers.hpp"
#include "restspy/http-status-code.hpp"
#include "restspy/invalid_argument_exception.hpp"
#include "restspy/log.hpp"
#include "restspy/server-result.hpp"
#include "restspy/url.hpp"

namespace restspy {

Server::Server(Url baseUrl, std::unique_ptr<HttpClient> httpClient)
    : _baseUrl(std::move(baseUrl)), _httpClient(std::move(httpClient)) {
  if (!_httpClient) {
    throw invalid_argument("Server requires an HTTP client");
  }
}

Server::~Server() = default;

ServerResult Server::get(std::string_view endpoint) {
  auto response = _httpClient->perform(HttpClientRequest{http::GET, _baseUrl.join(endpoint), {}, {}});
  if (response.hasError()) {
    return ServerResult(ToServerError(response.error()));
  }
  if (response->statusCode != http::StatusCodeOK) {
    log::debug("GET {} returned status code {}", _baseUrl.join(endpoint).str(), response->statusCode);
    return ServerResult(ServerResult::Error::HttpStatus, response->statusCode, std::move(response->body));
  }
  return ServerResult::Success(response->statusCode, std::move(response->body));
}

HttpClientResult Server::post(std::string_view endpoint, std::string data, http::Headers headers) {
  return _httpClient->perform(HttpClientRequest{http::POST, _baseUrl.join(endpoint), std::move(headers), std::move(data)});
}

HttpClientResult Server::del(std::string_view endpoint) {
  return _httpClient->perform(HttpClientRequest{http::DELETE, _baseUrl.join(endpoint), {}, {}});
}

ServerResult::Error ToServerError(HttpClientResult::Error error) {
  switch (error) {
    case HttpClientResult::Error::None:
      return ServerResult::Error::None;
    case HttpClientResult::Error::ConnectionFailure:
      return ServerResult::Error::ConnectionFailure;
    case HttpClientResult::Error::Timeout:
      return ServerResult::Error::Timeout;
    default:
      return ServerResult::Error::InvalidResponse;
  }
}

}  // namespace restspy
