#include "restspy/matchable.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "restspy/invalid_argument_exception.hpp"

namespace restspy {

namespace {

std::regex CompilePattern(std::string_view pattern) {
  try {
    return std::regex(pattern.begin(), pattern.end(), std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& ex) {
    throw invalid_argument("Invalid pattern '{}': {}", pattern, ex.what());
  }
}

}  // namespace

std::string GenerateUuid() {
  thread_local std::mt19937_64 gen{std::random_device{}()};

  std::array<uint8_t, 16> bytes;
  for (std::size_t pos = 0; pos < bytes.size(); pos += sizeof(uint64_t)) {
    auto val = gen();
    for (std::size_t byteIdx = 0; byteIdx < sizeof(uint64_t); ++byteIdx) {
      bytes[pos + byteIdx] = static_cast<uint8_t>(val & 0xFFU);
      val >>= 8;
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0FU) | 0x40U);  // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3FU) | 0x80U);  // variant 10xx

  static constexpr char kHex[] = "0123456789abcdef";
  std::string ret;
  ret.reserve(36);
  for (std::size_t idx = 0; idx < bytes.size(); ++idx) {
    if (idx == 4 || idx == 6 || idx == 8 || idx == 10) {
      ret.push_back('-');
    }
    ret.push_back(kHex[bytes[idx] >> 4]);
    ret.push_back(kHex[bytes[idx] & 0x0FU]);
  }
  return ret;
}

Matchable::Matchable(std::string_view pattern) : Matchable(GenerateUuid(), pattern) {}

Matchable::Matchable(std::string id, std::string_view pattern)
    : _id(std::move(id)), _pattern(pattern), _regex(CompilePattern(pattern)) {}

bool Matchable::matches(std::string_view path) const {
  return std::regex_search(path.begin(), path.end(), _regex);
}

}  // namespace restspy
