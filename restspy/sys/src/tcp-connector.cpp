#include "restspy/tcp-connector.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "restspy/base-fd.hpp"
#include "restspy/log.hpp"
#include "restspy/socket.hpp"

namespace restspy {

namespace {

bool SetBlocking(int fd, bool blocking) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  const int newFlags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, newFlags) == 0;
}

// Returns 0 on success, the pending socket error otherwise.
int WaitConnected(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd{fd, POLLOUT, 0};
  int ret;
  do {
    ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (ret == -1 && errno == EINTR);
  if (ret == 0) {
    return ETIMEDOUT;
  }
  if (ret == -1) {
    return errno;
  }
  int soError = 0;
  socklen_t len = sizeof(soError);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
    return errno;
  }
  return soError;
}

}  // namespace

ConnectResult ConnectTCP(std::string_view host, uint16_t port, std::chrono::milliseconds timeout) {
  // getaddrinfo expects null-terminated strings.
  const std::string hostStr(host);
  const std::string portStr = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);

  ConnectResult connectResult;
  if (gai != 0) [[unlikely]] {
    log::warn("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", hostStr, portStr, ::gai_strerror(gai));
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    BaseFd baseFd(::socket(rp->ai_family, rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, rp->ai_protocol));
    if (!baseFd) [[unlikely]] {
      const int saved = errno;
      log::error("ConnectTCP: socket() failed (family={}): {}", rp->ai_family, std::strerror(saved));
      if (saved == EMFILE || saved == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    int connectErr = 0;
    if (::connect(baseFd.fd(), rp->ai_addr, rp->ai_addrlen) != 0) {
      connectErr = errno;
      if (connectErr == EINPROGRESS || connectErr == EINTR) {
        connectErr = WaitConnected(baseFd.fd(), timeout);
      }
    }
    if (connectErr != 0) {
      log::debug("ConnectTCP: connect to {}:{} failed (family={}): {}", hostStr, port, rp->ai_family,
                 std::strerror(connectErr));
      continue;
    }
    if (!SetBlocking(baseFd.fd(), true)) {
      log::error("ConnectTCP: unable to switch fd # {} to blocking mode: {}", baseFd.fd(), std::strerror(errno));
      continue;
    }
    connectResult.socket = Socket(std::move(baseFd));
    return connectResult;
  }
  connectResult.failure = true;
  return connectResult;
}

}  // namespace restspy
