#include "restspy/local-server.hpp"

#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "restspy/child-process.hpp"
#include "restspy/http-client.hpp"
#include "restspy/http-constants.hpp"
#include "restspy/local-server-config.hpp"
#include "restspy/log.hpp"
#include "restspy/server-registry.hpp"
#include "restspy/server-result.hpp"
#include "restspy/server.hpp"
#include "restspy/timedef.hpp"
#include "restspy/url.hpp"

namespace restspy {

namespace {

Url BuildBaseUrl(const LocalServerConfig& config) {
  config.validate();
  const bool ipv6 = config.host.find(':') != std::string::npos;
  return Url::Parse(ipv6 ? std::format("http://[{}]:{}/", config.host, config.port)
                         : std::format("http://{}:{}/", config.host, config.port));
}

std::vector<std::string> BuildArgs(const LocalServerConfig& config) {
  std::vector<std::string> args;
  args.reserve(2 + config.extraArgs.size());
  args.push_back(config.portFlag);
  args.push_back(std::to_string(config.port));
  args.insert(args.end(), config.extraArgs.begin(), config.extraArgs.end());
  return args;
}

}  // namespace

LocalServer::LocalServer(ServerRegistry& registry, LocalServerConfig config, std::unique_ptr<HttpClient> httpClient)
    : Server(BuildBaseUrl(config), std::move(httpClient)), _registry(registry), _config(std::move(config)) {}

LocalServer::~LocalServer() { stop(); }

ServerResult LocalServer::start() {
  std::scoped_lock lock(_registry.mutex());

  auto result = _registry.registerServer(_config.port, *this);
  if (result.hasError()) {
    return result;
  }
  _state.store(State::starting, std::memory_order_release);

  const auto args = BuildArgs(_config);
  try {
    _process = ChildProcess::Spawn(_config.command, args);
  } catch (const std::system_error& ex) {
    log::error("Unable to spawn '{}': {}", _config.command, ex.what());
    abortStart();
    return ServerResult(ServerResult::Error::SpawnFailure);
  }
  log::info("Spawned '{}' (pid {}) for port {}", _config.command, _process.pid(), _config.port);

  result = waitUntilReachable();
  if (result.hasError()) {
    abortStart();
    return result;
  }
  _state.store(State::running, std::memory_order_release);
  log::info("Server {} is running", baseUrl().str());
  return result;
}

void LocalServer::stop() {
  std::scoped_lock lock(_registry.mutex());
  if (!_registry.unregister(_config.port, *this)) {
    return;
  }
  log::info("Stopping server on port {}", _config.port);
  _process.stop(_config.stopGracePeriod);
  _state.store(State::stopped, std::memory_order_release);
}

ServerResult LocalServer::waitUntilReachable() {
  const auto deadline = SteadyClock::now() + _config.readinessTimeout;
  while (true) {
    const auto reply = httpClient().perform(HttpClientRequest{http::GET, baseUrl(), {}, {}});
    if (!reply.hasError()) {
      return {};
    }
    if (reply.error() != HttpClientResult::Error::ConnectionFailure) {
      log::error("Readiness check of {} failed: {}", baseUrl().str(), ErrorStr(reply.error()));
      return ServerResult(ToServerError(reply.error()));
    }
    if (SteadyClock::now() + _config.readinessPollInterval > deadline) {
      log::error("Server on port {} not ready after {} ms", _config.port, _config.readinessTimeout.count());
      return ServerResult(ServerResult::Error::Timeout);
    }
    std::this_thread::sleep_for(_config.readinessPollInterval);
  }
}

void LocalServer::abortStart() {
  _process.stop(_config.stopGracePeriod);
  if (!_registry.unregister(_config.port, *this)) {
    log::warn("Port {} was already unregistered", _config.port);
  }
  _state.store(State::stopped, std::memory_order_release);
}

}  // namespace restspy
