#pragma once

#include <memory>
#include <string_view>

#include "restspy/http-client.hpp"
#include "restspy/server-result.hpp"
#include "restspy/server.hpp"
#include "restspy/socket-http-client.hpp"

namespace restspy {

// Server whose process is managed elsewhere. It is never spawned, killed or registered; stop() only resets its
// doubles and spy log so that the next test starts from a clean instance.
class ExternalServer : public Server {
 public:
  static constexpr std::string_view kDoublesEndpoint = "/doubles";
  static constexpr std::string_view kSpyEndpoint = "/spy";

  // Throws restspy::invalid_argument if baseUrl is not a valid http URL.
  explicit ExternalServer(std::string_view baseUrl,
                          std::unique_ptr<HttpClient> httpClient = std::make_unique<SocketHttpClient>());

  // Always succeeds.
  ServerResult start() override;

  // DELETE /doubles then DELETE /spy, best-effort: failures are logged and the second call is always attempted.
  void stop() override;
};

}  // namespace restspy
