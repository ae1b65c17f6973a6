#include "restspy/tcp-connector.hpp"

#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdint>

#include "restspy/socket.hpp"

namespace restspy {

using namespace std::chrono_literals;

TEST(TcpConnectorTest, ConnectsToListeningSocket) {
  Socket listener(AF_INET);
  uint16_t port = 0;
  listener.bindAndListen(port);
  ASSERT_NE(port, 0);

  auto result = ConnectTCP("127.0.0.1", port, 500ms);
  EXPECT_FALSE(result.failure);
  EXPECT_TRUE(result.socket);
  EXPECT_TRUE(result.socket.setTimeouts(100ms, 100ms));
}

TEST(TcpConnectorTest, RefusedConnectionIsReportedAsFailure) {
  uint16_t port = 0;
  {
    // Grab an ephemeral port, then release it so that nothing listens on it anymore.
    Socket listener(AF_INET);
    listener.bindAndListen(port);
  }
  auto result = ConnectTCP("127.0.0.1", port, 200ms);
  EXPECT_TRUE(result.failure);
  EXPECT_FALSE(result.socket);
}

TEST(TcpConnectorTest, UnknownHostIsReportedAsFailure) {
  auto result = ConnectTCP("host.invalid", 80, 200ms);
  EXPECT_TRUE(result.failure);
}

}  // namespace restspy
