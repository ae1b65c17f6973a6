#include "restspy/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <chrono>
#include <cstdint>

#include "restspy/base-fd.hpp"
#include "restspy/errno-throw.hpp"
#include "restspy/log.hpp"

namespace restspy {

namespace {
timeval ToTimeval(std::chrono::milliseconds timeout) {
  const auto ms = timeout.count();
  return timeval{static_cast<time_t>(ms / 1000), static_cast<suseconds_t>((ms % 1000) * 1000)};
}
}  // namespace

Socket::Socket(int family, int protocol) : _baseFd(::socket(family, SOCK_STREAM | SOCK_CLOEXEC, protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::trace("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(uint16_t& port) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed for fd # {}", fd());
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd(), SOMAXCONN) != 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      throw_errno("getsockname failed for fd # {}", fd());
    }
    port = ntohs(addr.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd(), port);
}

bool Socket::setTimeouts(std::chrono::milliseconds recvTimeout, std::chrono::milliseconds sendTimeout) const {
  const auto recvTv = ToTimeval(recvTimeout);
  const auto sendTv = ToTimeval(sendTimeout);
  return ::setsockopt(fd(), SOL_SOCKET, SO_RCVTIMEO, &recvTv, sizeof(recvTv)) == 0 &&
         ::setsockopt(fd(), SOL_SOCKET, SO_SNDTIMEO, &sendTv, sizeof(sendTv)) == 0;
}

}  // namespace restspy
