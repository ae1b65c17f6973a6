#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace restspy {

struct LocalServerConfig {
  static constexpr std::string_view kDefaultHost = "localhost";
  static constexpr std::string_view kDefaultCommand = "rest-spy";
  static constexpr std::string_view kDefaultPortFlag = "-p";

  LocalServerConfig() = default;

  explicit LocalServerConfig(uint16_t port) : port(port) {}

  // Throws restspy::invalid_argument if the configuration is invalid.
  void validate() const;

  LocalServerConfig& withHost(std::string_view host);

  LocalServerConfig& withPort(uint16_t port);

  LocalServerConfig& withCommand(std::string_view command);

  LocalServerConfig& withPortFlag(std::string_view portFlag);

  // Appended after '<portFlag> <port>'.
  LocalServerConfig& withExtraArg(std::string_view arg);

  LocalServerConfig& withReadinessTimeout(std::chrono::milliseconds readinessTimeout);

  LocalServerConfig& withReadinessPollInterval(std::chrono::milliseconds readinessPollInterval);

  LocalServerConfig& withStopGracePeriod(std::chrono::milliseconds stopGracePeriod);

  // Host used to reach the server once started.
  std::string host{kDefaultHost};

  // Port the spawned server listens on, passed on its command line.
  uint16_t port{0};

  // Executable to spawn, looked up in PATH if it has no '/'.
  std::string command{kDefaultCommand};

  std::string portFlag{kDefaultPortFlag};

  std::vector<std::string> extraArgs;

  // Maximum time start() waits for the server to answer.
  std::chrono::milliseconds readinessTimeout{3000};

  // Pause between two readiness requests.
  std::chrono::milliseconds readinessPollInterval{100};

  // Time given to the process to exit after SIGTERM, before SIGKILL.
  std::chrono::milliseconds stopGracePeriod{2000};
};

}  // namespace restspy
