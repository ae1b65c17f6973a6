#pragma once

#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>

namespace restspy {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("posix_spawnp failed for {}", command);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, std::vformat(fmt, std::make_format_args(args...)));
}

// Same as throw_errno, for APIs returning the error number instead of setting errno (posix_spawn family).
template <typename... Args>
[[noreturn]] void throw_errnum(int errnum, std::string_view fmt, Args&&... args) {
  std::error_code ec(errnum, std::generic_category());
  throw std::system_error(ec, std::vformat(fmt, std::make_format_args(args...)));
}

}  // namespace restspy
