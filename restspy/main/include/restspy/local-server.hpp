#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "restspy/child-process.hpp"
#include "restspy/http-client.hpp"
#include "restspy/local-server-config.hpp"
#include "restspy/server-registry.hpp"
#include "restspy/server-result.hpp"
#include "restspy/server.hpp"
#include "restspy/socket-http-client.hpp"

namespace restspy {

// Server backed by a child process spawned as '<command> <portFlag> <port> [extraArgs...]'.
// start() and stop() run entirely under the registry mutex, readiness wait included. Concurrent lifecycle
// transitions of different local servers sharing a registry are thus serialized.
class LocalServer : public Server {
 public:
  enum class State : std::uint8_t { stopped, starting, running };

  // Throws restspy::invalid_argument if config is invalid.
  LocalServer(ServerRegistry& registry, LocalServerConfig config,
              std::unique_ptr<HttpClient> httpClient = std::make_unique<SocketHttpClient>());

  // Calls stop().
  ~LocalServer() override;

  // Register for the configured port, spawn the process and block until the server answers a GET on its base URL
  // (any status code).
  // Only connection failures mean 'not ready yet' and are retried, until readinessTimeout elapses (Timeout error).
  // Any other failure of the readiness request (receive timeout, malformed response) fails start immediately with
  // the corresponding error.
  // On error, the spawned process (if any) is terminated and the port is unregistered.
  ServerResult start() override;

  // Unregister and terminate the process. No-op if this server is not the one registered for its port.
  void stop() override;

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  [[nodiscard]] const LocalServerConfig& config() const noexcept { return _config; }

 private:
  ServerResult waitUntilReachable();

  void abortStart();

  ServerRegistry& _registry;
  LocalServerConfig _config;
  ChildProcess _process;
  std::atomic<State> _state{State::stopped};
};

}  // namespace restspy
