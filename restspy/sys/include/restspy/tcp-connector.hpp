#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "restspy/socket.hpp"

namespace restspy {

struct ConnectResult {
  Socket socket;
  bool failure{false};
};

// Resolve host:port and connect to the first address accepting the connection within timeout.
// The returned socket is in blocking mode.
// Connection failures (name resolution, refused, unreachable, timeout) are reported with failure = true
// rather than thrown: for callers polling a server that is still starting, they are expected.
ConnectResult ConnectTCP(std::string_view host, uint16_t port, std::chrono::milliseconds timeout);

}  // namespace restspy
