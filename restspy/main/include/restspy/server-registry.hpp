#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include "restspy/server-result.hpp"

namespace restspy {

class Server;

// Directory of the running servers, keyed by port. At most one server per port.
// All member functions are thread safe. The registry mutex is recursive and exposed so that a server can make
// 'check the registry' and 'spawn or kill its process' atomic with respect to the other servers.
// Servers are not owned: a registered server must unregister itself (or be stopped by shutdown()) before being
// destroyed, and the registry must outlive the servers using it.
class ServerRegistry {
 public:
  using Visitor = std::function<void(uint16_t, Server&)>;

  ServerRegistry() = default;

  ServerRegistry(const ServerRegistry&) = delete;
  ServerRegistry(ServerRegistry&&) noexcept = delete;
  ServerRegistry& operator=(const ServerRegistry&) = delete;
  ServerRegistry& operator=(ServerRegistry&&) noexcept = delete;

  // Calls shutdown().
  ~ServerRegistry();

  // Fails with DuplicatePort if a server is already registered for 'port'.
  ServerResult registerServer(uint16_t port, Server& server);

  // Remove 'server' from 'port'. Returns true if it was registered there, false otherwise (nothing registered for
  // 'port', or another server owns it, in which case the registry is left unchanged).
  bool unregister(uint16_t port, const Server& server);

  // Calls visitor on each registered server, in increasing port order.
  // Iterates over a snapshot taken under the lock; the visitor is called without the lock held and may therefore
  // register or unregister servers.
  void each(const Visitor& visitor);

  // Stop every registered server, best-effort: an exception thrown by a server's stop() is logged and does not
  // prevent stopping the others. A server is stopped at most once per call.
  void shutdown();

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] bool contains(uint16_t port) const;

  std::recursive_mutex& mutex() noexcept { return _mutex; }

 private:
  mutable std::recursive_mutex _mutex;
  std::map<uint16_t, Server*> _servers;
};

}  // namespace restspy
