#include "restspy/server-registry.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

#include "restspy/log.hpp"
#include "restspy/server-result.hpp"
#include "restspy/server.hpp"

namespace restspy {

ServerRegistry::~ServerRegistry() { shutdown(); }

ServerResult ServerRegistry::registerServer(uint16_t port, Server& server) {
  std::scoped_lock lock(_mutex);
  const auto [it, inserted] = _servers.emplace(port, &server);
  if (!inserted) {
    log::warn("A server is already registered for port {}", port);
    return ServerResult(ServerResult::Error::DuplicatePort);
  }
  log::debug("Registered server {} for port {}", server.baseUrl().str(), port);
  return {};
}

bool ServerRegistry::unregister(uint16_t port, const Server& server) {
  std::scoped_lock lock(_mutex);
  const auto it = _servers.find(port);
  if (it == _servers.end() || it->second != &server) {
    return false;
  }
  _servers.erase(it);
  return true;
}

void ServerRegistry::each(const Visitor& visitor) {
  std::vector<std::pair<uint16_t, Server*>> snapshot;
  {
    std::scoped_lock lock(_mutex);
    snapshot.assign(_servers.begin(), _servers.end());
  }
  for (auto [port, server] : snapshot) {
    visitor(port, *server);
  }
}

void ServerRegistry::shutdown() {
  std::size_t nbStopped = 0;
  each([&nbStopped](uint16_t port, Server& server) {
    try {
      server.stop();
      ++nbStopped;
    } catch (const std::exception& ex) {
      log::error("Unable to stop server on port {}: {}", port, ex.what());
    }
  });
  if (nbStopped != 0) {
    log::info("Stopped {} server(s) at shutdown", nbStopped);
  }
}

std::size_t ServerRegistry::size() const {
  std::scoped_lock lock(_mutex);
  return _servers.size();
}

bool ServerRegistry::contains(uint16_t port) const {
  std::scoped_lock lock(_mutex);
  return _servers.contains(port);
}

}  // namespace restspy
