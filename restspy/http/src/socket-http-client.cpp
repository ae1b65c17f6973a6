#include "restspy/socket-http-client.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

#include "restspy/http-client-config.hpp"
#include "restspy/http-client.hpp"
#include "restspy/http-response-parser.hpp"
#include "restspy/log.hpp"
#include "restspy/raw-chars.hpp"
#include "restspy/tcp-connector.hpp"

namespace restspy {

namespace {

constexpr std::size_t kRecvChunkSize = 4096;

using Error = HttpClientResult::Error;

Error ErrorFromErrno(int err) {
  return err == EAGAIN || err == EWOULDBLOCK ? Error::Timeout : Error::ConnectionFailure;
}

Error SendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const ssize_t sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      log::debug("send on fd # {} failed: {}", fd, std::strerror(err));
      return ErrorFromErrno(err);
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return Error::None;
}

// Read until the peer closes.
// A peer closing before sending anything is a connection failure, as is a reset connection.
Error RecvAll(int fd, std::size_t maxBytes, RawChars& out) {
  while (true) {
    out.ensureAvailableCapacityExponential(kRecvChunkSize);
    const ssize_t nb = ::recv(fd, out.data() + out.size(), out.availableCapacity(), 0);
    if (nb == -1) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      log::debug("recv on fd # {} failed: {}", fd, std::strerror(err));
      return ErrorFromErrno(err);
    }
    if (nb == 0) {
      return out.empty() ? Error::ConnectionFailure : Error::None;
    }
    out.addSize(static_cast<std::size_t>(nb));
    if (out.size() > maxBytes) {
      log::warn("Response exceeds the limit of {} bytes", maxBytes);
      return Error::InvalidResponse;
    }
  }
}

}  // namespace

SocketHttpClient::SocketHttpClient(HttpClientConfig config) : _config(std::move(config)) { _config.validate(); }

HttpClientResult SocketHttpClient::perform(const HttpClientRequest& request) {
  auto [sock, failure] = ConnectTCP(request.url.host(), request.url.port(), _config.connectTimeout);
  if (failure) {
    log::debug("Unable to connect to {}", request.url.authority());
    return HttpClientResult(Error::ConnectionFailure);
  }
  if (!sock.setTimeouts(_config.recvTimeout, _config.recvTimeout)) {
    log::warn("Unable to set timeouts on fd # {}", sock.fd());
  }

  const std::string raw = BuildRawRequest(request);
  log::trace("{} {}", request.method, request.url.str());
  auto error = SendAll(sock.fd(), raw);
  if (error != Error::None) {
    return HttpClientResult(error);
  }

  RawChars buf(kRecvChunkSize);
  error = RecvAll(sock.fd(), _config.maxResponseBytes, buf);
  if (error != Error::None) {
    return HttpClientResult(error);
  }

  auto response = ParseRawResponse(std::string_view(buf));
  if (!response) {
    log::warn("Malformed HTTP response from {} ({} bytes)", request.url.authority(), buf.size());
    return HttpClientResult(Error::InvalidResponse);
  }
  return std::move(*response);
}

}  // namespace restspy
