#include "restspy/external-server.hpp"

#include <initializer_list>
#include <memory>
#include <string_view>
#include <utility>

#include "restspy/http-client.hpp"
#include "restspy/log.hpp"
#include "restspy/server-result.hpp"
#include "restspy/server.hpp"
#include "restspy/url.hpp"

namespace restspy {

ExternalServer::ExternalServer(std::string_view baseUrl, std::unique_ptr<HttpClient> httpClient)
    : Server(Url::Parse(baseUrl), std::move(httpClient)) {}

ServerResult ExternalServer::start() { return {}; }

void ExternalServer::stop() {
  for (std::string_view endpoint : {kDoublesEndpoint, kSpyEndpoint}) {
    const auto response = del(endpoint);
    if (response.hasError()) {
      log::warn("Unable to reset {} on {}: {}", endpoint, baseUrl().str(), ErrorStr(response.error()));
    } else {
      log::debug("DELETE {} on {} returned {}", endpoint, baseUrl().str(), response->statusCode);
    }
  }
}

}  // namespace restspy
