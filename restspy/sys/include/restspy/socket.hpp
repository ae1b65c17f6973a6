#pragma once

#include <chrono>
#include <cstdint>
#include <utility>

#include "restspy/base-fd.hpp"

namespace restspy {

// Simple RAII class wrapping a blocking IPv4/IPv6 stream socket.
class Socket {
 public:
  Socket() noexcept = default;

  // Adopt an already opened socket.
  explicit Socket(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  // Create a new blocking stream socket of the given family (AF_INET by default).
  // Throws std::system_error on failure.
  explicit Socket(int family, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind on the loopback interface and start listening. If port is 0, an ephemeral port is chosen and written back.
  // Throws std::system_error on failure.
  void bindAndListen(uint16_t& port);

  // Apply SO_RCVTIMEO and SO_SNDTIMEO. Returns false if setsockopt failed.
  [[nodiscard]] bool setTimeouts(std::chrono::milliseconds recvTimeout, std::chrono::milliseconds sendTimeout) const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace restspy
