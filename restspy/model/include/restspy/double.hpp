#pragma once

#include <string>
#include <string_view>

#include "restspy/http-headers.hpp"
#include "restspy/http-status-code.hpp"
#include "restspy/matchable.hpp"

namespace restspy {

// Canned response served for requests whose path matches the pattern.
class Double : public Matchable {
 public:
  Double(std::string_view pattern, http::StatusCode statusCode, http::Headers headers = {}, std::string body = {});

  Double(std::string id, std::string_view pattern, http::StatusCode statusCode, http::Headers headers = {},
         std::string body = {});

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

 private:
  http::Headers _headers;
  std::string _body;
  http::StatusCode _statusCode;
};

}  // namespace restspy
