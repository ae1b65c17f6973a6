#include "restspy/http-client-config.hpp"

#include <chrono>
#include <cstddef>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

void HttpClientConfig::validate() const {
  if (connectTimeout <= std::chrono::milliseconds{0}) {
    throw invalid_argument("connectTimeout must be > 0");
  }
  if (recvTimeout <= std::chrono::milliseconds{0}) {
    throw invalid_argument("recvTimeout must be > 0");
  }
  if (maxResponseBytes == 0) {
    throw invalid_argument("maxResponseBytes must be > 0");
  }
}

HttpClientConfig& HttpClientConfig::withConnectTimeout(std::chrono::milliseconds connectTimeout) {
  this->connectTimeout = connectTimeout;
  return *this;
}

HttpClientConfig& HttpClientConfig::withRecvTimeout(std::chrono::milliseconds recvTimeout) {
  this->recvTimeout = recvTimeout;
  return *this;
}

HttpClientConfig& HttpClientConfig::withMaxResponseBytes(std::size_t maxResponseBytes) {
  this->maxResponseBytes = maxResponseBytes;
  return *this;
}

}  // namespace restspy
