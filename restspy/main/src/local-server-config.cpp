#include "restspy/local-server-config.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

void LocalServerConfig::validate() const {
  if (port == 0) {
    throw invalid_argument("port must be set");
  }
  if (host.empty()) {
    throw invalid_argument("host must not be empty");
  }
  if (command.empty()) {
    throw invalid_argument("command must not be empty");
  }
  if (readinessPollInterval <= std::chrono::milliseconds{0}) {
    throw invalid_argument("readinessPollInterval must be > 0");
  }
  if (readinessPollInterval > readinessTimeout) {
    throw invalid_argument("readinessPollInterval ({} ms) must not exceed readinessTimeout ({} ms)",
                           readinessPollInterval.count(), readinessTimeout.count());
  }
  if (stopGracePeriod < std::chrono::milliseconds{0}) {
    throw invalid_argument("stopGracePeriod must be >= 0");
  }
}

LocalServerConfig& LocalServerConfig::withHost(std::string_view host) {
  this->host = host;
  return *this;
}

LocalServerConfig& LocalServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

LocalServerConfig& LocalServerConfig::withCommand(std::string_view command) {
  this->command = command;
  return *this;
}

LocalServerConfig& LocalServerConfig::withPortFlag(std::string_view portFlag) {
  this->portFlag = portFlag;
  return *this;
}

LocalServerConfig& LocalServerConfig::withExtraArg(std::string_view arg) {
  extraArgs.emplace_back(arg);
  return *this;
}

LocalServerConfig& LocalServerConfig::withReadinessTimeout(std::chrono::milliseconds readinessTimeout) {
  this->readinessTimeout = readinessTimeout;
  return *this;
}

LocalServerConfig& LocalServerConfig::withReadinessPollInterval(std::chrono::milliseconds readinessPollInterval) {
  this->readinessPollInterval = readinessPollInterval;
  return *this;
}

LocalServerConfig& LocalServerConfig::withStopGracePeriod(std::chrono::milliseconds stopGracePeriod) {
  this->stopGracePeriod = stopGracePeriod;
  return *this;
}

}  // namespace restspy
