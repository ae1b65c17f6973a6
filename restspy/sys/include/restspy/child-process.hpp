#pragma once

#include <sys/types.h>

#include <chrono>
#include <span>
#include <string>
#include <string_view>

namespace restspy {

// RAII owner of a spawned child process sharing the standard streams of the current process.
// Move-only; a running child is stopped on destruction.
class ChildProcess {
 public:
  static constexpr pid_t kNoPid = -1;
  static constexpr std::chrono::milliseconds kDefaultGracePeriod{2000};

  ChildProcess() noexcept = default;

  // Spawn 'command' (looked up in PATH when it contains no '/') with the given arguments.
  // argv[0] is set to command. Throws std::system_error if the process cannot be started.
  static ChildProcess Spawn(std::string_view command, std::span<const std::string> args);

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ChildProcess& operator=(ChildProcess&& other) noexcept;

  ~ChildProcess();

  [[nodiscard]] pid_t pid() const noexcept { return _pid; }

  // Returns true while the child has not been reaped, i.e. it is running or has not yet been waited for.
  explicit operator bool() const noexcept { return _pid != kNoPid; }

  // Non-blocking check. Reaps the child if it already exited.
  [[nodiscard]] bool isRunning();

  // Exit status as returned by waitpid, valid once the child has been reaped.
  [[nodiscard]] int exitStatus() const noexcept { return _status; }

  // Send SIGTERM, wait up to gracePeriod for the child to exit, then SIGKILL it. Always reaps the child.
  // Idempotent: no-op if there is no child.
  void stop(std::chrono::milliseconds gracePeriod = kDefaultGracePeriod) noexcept;

 private:
  explicit ChildProcess(pid_t pid) noexcept : _pid(pid) {}

  bool tryReap() noexcept;

  pid_t _pid{kNoPid};
  int _status{0};
};

}  // namespace restspy
