// Minimal stand-in for the rest-spy server binary, used by lifecycle tests.
// Usage: restspy-fake-server -p <port> [--delay-ms <ms>] [--status <code>]
// Listens on the loopback interface and answers every request with the given status code (200 by default) and
// body "ok", closing the connection after each response. Runs until killed.

#include <sys/socket.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "restspy/base-fd.hpp"
#include "restspy/http-constants.hpp"
#include "restspy/http-status-code.hpp"
#include "restspy/log.hpp"
#include "restspy/socket.hpp"

namespace restspy {
namespace {

struct FakeServerOptions {
  uint16_t port{0};
  int delayMs{0};
  http::StatusCode statusCode{http::StatusCodeOK};
};

template <class T>
bool ParseNumber(std::string_view str, T& value) {
  const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool ParseOptions(int argc, char** argv, FakeServerOptions& options) {
  for (int argPos = 1; argPos + 1 < argc; argPos += 2) {
    const std::string_view flag = argv[argPos];
    const std::string_view value = argv[argPos + 1];
    bool ok = false;
    if (flag == "-p") {
      ok = ParseNumber(value, options.port);
    } else if (flag == "--delay-ms") {
      ok = ParseNumber(value, options.delayMs);
    } else if (flag == "--status") {
      ok = ParseNumber(value, options.statusCode);
    }
    if (!ok) {
      log::error("Invalid option {} {}", flag, value);
      return false;
    }
  }
  return argc % 2 == 1 && options.port != 0;
}

void Serve(Socket& conn, std::string_view reply) {
  if (!conn.setTimeouts(std::chrono::milliseconds{500}, std::chrono::milliseconds{500})) {
    log::warn("Unable to set timeouts on fd # {}", conn.fd());
  }
  std::string request;
  char buf[1024];
  while (request.find(http::DoubleCRLF) == std::string::npos) {
    const auto nb = ::recv(conn.fd(), buf, sizeof(buf), 0);
    if (nb <= 0) {
      return;
    }
    request.append(buf, static_cast<std::size_t>(nb));
  }
  log::debug("{}", std::string_view(request).substr(0, request.find(http::CRLF)));
  while (!reply.empty()) {
    const auto nb = ::send(conn.fd(), reply.data(), reply.size(), MSG_NOSIGNAL);
    if (nb <= 0) {
      log::warn("send failed: {}", std::strerror(errno));
      return;
    }
    reply.remove_prefix(static_cast<std::size_t>(nb));
  }
}

int Run(const FakeServerOptions& options) {
  if (options.delayMs > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds{options.delayMs});
  }
  Socket listener(AF_INET);
  uint16_t port = options.port;
  listener.bindAndListen(port);
  log::info("Fake server listening on port {}", port);

  const std::string reply = std::format("HTTP/1.1 {} Fake\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok",
                                        options.statusCode);
  while (true) {
    Socket conn(BaseFd(::accept(listener.fd(), nullptr, nullptr)));
    if (!conn) {
      if (errno == EINTR) {
        continue;
      }
      log::error("accept failed: {}", std::strerror(errno));
      return 1;
    }
    Serve(conn, reply);
  }
}

}  // namespace
}  // namespace restspy

int main(int argc, char** argv) {
  restspy::FakeServerOptions options;
  if (!restspy::ParseOptions(argc, argv, options)) {
    restspy::log::error("Usage: {} -p <port> [--delay-ms <ms>] [--status <code>]", argv[0]);
    return 2;
  }
  try {
    return restspy::Run(options);
  } catch (const std::exception& ex) {
    restspy::log::critical("Fake server failed: {}", ex.what());
    return 1;
  }
}
