#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>

namespace restspy {

// Base exception of restspy, storing its message inline so that throwing never allocates.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 127;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto res = std::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    char* end = res.out;
    if (std::cmp_greater(res.size, kMsgMaxLen)) {
      static constexpr std::string_view kEllipsis = "...";
      end = std::copy(kEllipsis.begin(), kEllipsis.end(), _data + kMsgMaxLen - kEllipsis.size());
    }
    *end = '\0';
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1]{};
};

}  // namespace restspy
