#include "restspy/child-process.hpp"

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "restspy/errno-throw.hpp"
#include "restspy/log.hpp"
#include "restspy/timedef.hpp"

extern char** environ;

namespace restspy {

namespace {
constexpr std::chrono::milliseconds kReapPollInterval{10};
}  // namespace

ChildProcess ChildProcess::Spawn(std::string_view command, std::span<const std::string> args) {
  std::string commandStr(command);
  std::vector<char*> argv;
  argv.reserve(args.size() + 2U);
  argv.push_back(commandStr.data());
  for (const std::string& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  // No file actions: stdin, stdout and stderr are inherited from the parent.
  pid_t pid = kNoPid;
  const int err = ::posix_spawnp(&pid, commandStr.c_str(), nullptr, nullptr, argv.data(), environ);
  if (err != 0) {
    throw_errnum(err, "posix_spawnp failed for '{}'", commandStr);
  }
  log::debug("Spawned '{}' with pid {}", commandStr, pid);
  return ChildProcess(pid);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : _pid(std::exchange(other._pid, kNoPid)), _status(std::exchange(other._status, 0)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if (this != &other) {
    stop();
    _pid = std::exchange(other._pid, kNoPid);
    _status = std::exchange(other._status, 0);
  }
  return *this;
}

ChildProcess::~ChildProcess() { stop(); }

bool ChildProcess::isRunning() { return _pid != kNoPid && !tryReap(); }

bool ChildProcess::tryReap() noexcept {
  int status = 0;
  pid_t ret;
  do {
    ret = ::waitpid(_pid, &status, WNOHANG);
  } while (ret == -1 && errno == EINTR);
  if (ret == 0) {
    return false;
  }
  if (ret == -1) {
    // ECHILD: already reaped elsewhere, nothing more can be done with this pid.
    log::error("waitpid failed for pid {}: {}", _pid, std::strerror(errno));
  } else {
    _status = status;
    log::debug("Child pid {} exited with status {}", _pid, status);
  }
  _pid = kNoPid;
  return true;
}

void ChildProcess::stop(std::chrono::milliseconds gracePeriod) noexcept {
  if (_pid == kNoPid || tryReap()) {
    return;
  }
  const pid_t pid = _pid;
  if (::kill(pid, SIGTERM) != 0) {
    log::error("kill(SIGTERM) failed for pid {}: {}", pid, std::strerror(errno));
  }
  for (const auto deadline = SteadyClock::now() + gracePeriod; SteadyClock::now() < deadline;
       std::this_thread::sleep_for(kReapPollInterval)) {
    if (tryReap()) {
      return;
    }
  }
  log::warn("Child pid {} did not exit within {} ms after SIGTERM, sending SIGKILL", pid, gracePeriod.count());
  if (::kill(pid, SIGKILL) != 0) {
    log::error("kill(SIGKILL) failed for pid {}: {}", pid, std::strerror(errno));
  }
  int status = 0;
  pid_t ret;
  do {
    ret = ::waitpid(pid, &status, 0);
  } while (ret == -1 && errno == EINTR);
  _status = status;
  _pid = kNoPid;
}

}  // namespace restspy
