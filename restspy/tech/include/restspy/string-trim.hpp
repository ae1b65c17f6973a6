#pragma once

#include <string_view>

namespace restspy {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && (*begin == ' ' || *begin == '\t')) {
    ++begin;
  }
  while (begin != end && (*(end - 1) == ' ' || *(end - 1) == '\t')) {
    --end;
  }
  return {begin, end};
}

}  // namespace restspy
