#pragma once

#include <chrono>
#include <cstddef>

namespace restspy {

struct HttpClientConfig {
  void validate() const;

  HttpClientConfig& withConnectTimeout(std::chrono::milliseconds connectTimeout);

  HttpClientConfig& withRecvTimeout(std::chrono::milliseconds recvTimeout);

  HttpClientConfig& withMaxResponseBytes(std::size_t maxResponseBytes);

  // Maximum duration of the TCP connection establishment.
  std::chrono::milliseconds connectTimeout{1000};

  // Socket receive (and send) timeout, applied to each individual system call.
  std::chrono::milliseconds recvTimeout{1000};

  // Safety cap on the size of a raw response (head and body). Larger responses are reported as a failure.
  std::size_t maxResponseBytes{16UL * 1024UL * 1024UL};
};

}  // namespace restspy
