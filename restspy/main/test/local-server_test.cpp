#include "restspy/local-server.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "restspy/fake-http-client.hpp"
#include "restspy/http-client.hpp"
#include "restspy/invalid_argument_exception.hpp"
#include "restspy/local-server-config.hpp"
#include "restspy/server-registry.hpp"
#include "restspy/server-result.hpp"
#include "restspy/socket.hpp"
#include "restspy/timedef.hpp"

namespace restspy {

using namespace std::chrono_literals;
using test::FakeHttpClient;

namespace {

uint16_t FreePort() {
  Socket sock(AF_INET);
  uint16_t port = 0;
  sock.bindAndListen(port);
  return port;
}

LocalServerConfig FakeServerConfig(uint16_t port) {
  return LocalServerConfig(port)
      .withHost("127.0.0.1")
      .withCommand(RESTSPY_FAKE_SERVER_PATH)
      .withReadinessTimeout(3000ms)
      .withReadinessPollInterval(20ms)
      .withStopGracePeriod(500ms);
}

}  // namespace

class LocalServerTest : public ::testing::Test {
 protected:
  ServerRegistry registry;
  uint16_t port{FreePort()};
};

TEST_F(LocalServerTest, InvalidConfig) {
  EXPECT_THROW(LocalServer(registry, LocalServerConfig{}), invalid_argument);
  EXPECT_THROW(LocalServer(registry, LocalServerConfig(port), nullptr), invalid_argument);
}

TEST_F(LocalServerTest, BaseUrl) {
  LocalServer server(registry, LocalServerConfig(4000));
  EXPECT_EQ(server.baseUrl().str(), "http://localhost:4000/");
  EXPECT_EQ(server.port(), 4000);
  EXPECT_EQ(server.state(), LocalServer::State::stopped);

  LocalServer ipv6(registry, LocalServerConfig(4001).withHost("::1"));
  EXPECT_EQ(ipv6.baseUrl().str(), "http://[::1]:4001/");
}

TEST_F(LocalServerTest, StartAndStop) {
  LocalServer server(registry, FakeServerConfig(port));

  const auto result = server.start();
  ASSERT_FALSE(result.hasError()) << ErrorStr(result.error());
  EXPECT_EQ(server.state(), LocalServer::State::running);
  EXPECT_TRUE(registry.contains(port));

  const auto getResult = server.get("/spy");
  ASSERT_FALSE(getResult.hasError());
  EXPECT_EQ(getResult.body(), "ok");

  server.stop();
  EXPECT_EQ(server.state(), LocalServer::State::stopped);
  EXPECT_FALSE(registry.contains(port));
  EXPECT_EQ(server.get("/spy").error(), ServerResult::Error::ConnectionFailure);
}

TEST_F(LocalServerTest, WaitsForSlowServer) {
  LocalServer server(registry, FakeServerConfig(port).withExtraArg("--delay-ms").withExtraArg("300"));

  const auto before = SteadyClock::now();
  ASSERT_FALSE(server.start().hasError());
  EXPECT_GE(SteadyClock::now() - before, 300ms);
  EXPECT_EQ(server.state(), LocalServer::State::running);
}

TEST_F(LocalServerTest, AnyStatusCodeMeansReady) {
  LocalServer server(registry, FakeServerConfig(port).withExtraArg("--status").withExtraArg("500"));

  ASSERT_FALSE(server.start().hasError());
  const auto result = server.get("/");
  EXPECT_EQ(result.error(), ServerResult::Error::HttpStatus);
  EXPECT_EQ(result.statusCode(), 500);
}

TEST_F(LocalServerTest, TimeoutWhenServerNeverAnswers) {
  auto client = std::make_unique<FakeHttpClient>(FakeHttpClient::Failing());
  auto state = client->state();
  LocalServer server(registry,
                     FakeServerConfig(port).withReadinessTimeout(300ms).withReadinessPollInterval(50ms),
                     std::move(client));

  const auto before = SteadyClock::now();
  const auto result = server.start();
  const auto elapsed = SteadyClock::now() - before;

  ASSERT_TRUE(result.hasError());
  EXPECT_EQ(result.error(), ServerResult::Error::Timeout);
  EXPECT_GE(elapsed, 250ms);
  EXPECT_LT(elapsed, 3s);
  EXPECT_GE(state->nbRequests(), 2U);
  EXPECT_EQ(server.state(), LocalServer::State::stopped);
  EXPECT_FALSE(registry.contains(port));

  // the port is free again
  server.stop();
  ASSERT_FALSE(LocalServer(registry, FakeServerConfig(port)).start().hasError());
}

TEST_F(LocalServerTest, TimeoutWithDefaultBudget) {
  LocalServer server(registry, LocalServerConfig(port).withCommand(RESTSPY_FAKE_SERVER_PATH),
                     std::make_unique<FakeHttpClient>(FakeHttpClient::Failing()));

  const auto before = SteadyClock::now();
  EXPECT_EQ(server.start().error(), ServerResult::Error::Timeout);
  const auto elapsed = SteadyClock::now() - before;
  EXPECT_GE(elapsed, 2900ms);
  EXPECT_LT(elapsed, 6s);
  EXPECT_FALSE(registry.contains(port));
}

TEST_F(LocalServerTest, ReadinessReceiveTimeoutFailsStartAtOnce) {
  auto client = std::make_unique<FakeHttpClient>(FakeHttpClient::Failing(HttpClientResult::Error::Timeout));
  auto state = client->state();
  LocalServer server(registry, FakeServerConfig(port).withReadinessTimeout(3000ms), std::move(client));

  const auto before = SteadyClock::now();
  EXPECT_EQ(server.start().error(), ServerResult::Error::Timeout);
  EXPECT_LT(SteadyClock::now() - before, 2s);
  EXPECT_EQ(state->nbRequests(), 1U);
  EXPECT_EQ(server.state(), LocalServer::State::stopped);
  EXPECT_FALSE(registry.contains(port));
}

TEST_F(LocalServerTest, MalformedReadinessAnswerFailsStart) {
  auto client = std::make_unique<FakeHttpClient>(FakeHttpClient::Failing(HttpClientResult::Error::InvalidResponse));
  auto state = client->state();
  LocalServer server(registry, FakeServerConfig(port), std::move(client));

  EXPECT_EQ(server.start().error(), ServerResult::Error::InvalidResponse);
  EXPECT_EQ(state->nbRequests(), 1U);
  EXPECT_EQ(server.state(), LocalServer::State::stopped);
  EXPECT_FALSE(registry.contains(port));
}

TEST_F(LocalServerTest, SpawnFailure) {
  LocalServer server(registry, LocalServerConfig(port).withCommand("/nonexistent/restspy-unknown-binary"),
                     std::make_unique<FakeHttpClient>(FakeHttpClient::Always(FakeHttpClient::Status(200))));

  EXPECT_EQ(server.start().error(), ServerResult::Error::SpawnFailure);
  EXPECT_EQ(server.state(), LocalServer::State::stopped);
  EXPECT_FALSE(registry.contains(port));
}

TEST_F(LocalServerTest, DoubleStartIsDuplicatePort) {
  LocalServer server(registry, FakeServerConfig(port));
  ASSERT_FALSE(server.start().hasError());

  EXPECT_EQ(server.start().error(), ServerResult::Error::DuplicatePort);
  EXPECT_EQ(server.state(), LocalServer::State::running);

  {
    LocalServer other(registry, FakeServerConfig(port),
                      std::make_unique<FakeHttpClient>(FakeHttpClient::Always(FakeHttpClient::Status(200))));
    EXPECT_EQ(other.start().error(), ServerResult::Error::DuplicatePort);
    other.stop();
  }
  // neither the rejected server's stop nor its destruction releases the port of the running one
  EXPECT_TRUE(registry.contains(port));
  EXPECT_EQ(server.state(), LocalServer::State::running);
  EXPECT_FALSE(server.get("/").hasError());

  server.stop();
  EXPECT_FALSE(registry.contains(port));
  EXPECT_EQ(server.get("/").error(), ServerResult::Error::ConnectionFailure);
}

TEST_F(LocalServerTest, StopIsIdempotent) {
  LocalServer server(registry, FakeServerConfig(port));
  server.stop();
  ASSERT_FALSE(server.start().hasError());
  server.stop();
  server.stop();
  EXPECT_EQ(server.state(), LocalServer::State::stopped);
  EXPECT_EQ(registry.size(), 0U);
}

TEST_F(LocalServerTest, RestartAfterStop) {
  LocalServer server(registry, FakeServerConfig(port));
  ASSERT_FALSE(server.start().hasError());
  server.stop();
  ASSERT_FALSE(server.start().hasError());
  EXPECT_FALSE(server.get("/").hasError());
}

TEST_F(LocalServerTest, RegistryShutdownStopsServers) {
  const uint16_t otherPort = FreePort();
  LocalServer server1(registry, FakeServerConfig(port));
  LocalServer server2(registry, FakeServerConfig(otherPort));
  ASSERT_FALSE(server1.start().hasError());
  ASSERT_FALSE(server2.start().hasError());
  EXPECT_EQ(registry.size(), 2U);

  registry.shutdown();

  EXPECT_EQ(registry.size(), 0U);
  EXPECT_EQ(server1.state(), LocalServer::State::stopped);
  EXPECT_EQ(server2.state(), LocalServer::State::stopped);
  EXPECT_EQ(server1.get("/").error(), ServerResult::Error::ConnectionFailure);
}

TEST_F(LocalServerTest, ConcurrentStartsOfDifferentPortsSerialize) {
  const uint16_t otherPort = FreePort();
  LocalServer server1(registry, FakeServerConfig(port));
  LocalServer server2(registry, FakeServerConfig(otherPort));

  std::vector<ServerResult> results(2);
  {
    std::jthread thread1([&] { results[0] = server1.start(); });
    std::jthread thread2([&] { results[1] = server2.start(); });
  }
  EXPECT_FALSE(results[0].hasError());
  EXPECT_FALSE(results[1].hasError());
  EXPECT_EQ(registry.size(), 2U);
}

TEST_F(LocalServerTest, ConcurrentStartsOfSamePort) {
  LocalServer server1(registry, FakeServerConfig(port));
  LocalServer server2(registry, FakeServerConfig(port));

  std::vector<ServerResult> results(2);
  {
    std::jthread thread1([&] { results[0] = server1.start(); });
    std::jthread thread2([&] { results[1] = server2.start(); });
  }
  EXPECT_NE(results[0].hasError(), results[1].hasError());
  const auto& failed = results[0].hasError() ? results[0] : results[1];
  EXPECT_EQ(failed.error(), ServerResult::Error::DuplicatePort);
  EXPECT_EQ(registry.size(), 1U);
}

}  // namespace restspy
