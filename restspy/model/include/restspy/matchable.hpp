#pragma once

#include <regex>
#include <string>
#include <string_view>

namespace restspy {

// Path-pattern entity with a stable identity.
// The pattern is an ECMAScript regular expression searched (not anchored) in the request path,
// so Matchable("/test") matches "/test" and "/test/42", while "^/test$" only matches "/test".
class Matchable {
 public:
  // Generates a random (version 4) UUID as id.
  // Throws restspy::invalid_argument if pattern is not a valid regular expression.
  explicit Matchable(std::string_view pattern);

  // Throws restspy::invalid_argument if pattern is not a valid regular expression.
  Matchable(std::string id, std::string_view pattern);

  [[nodiscard]] const std::string& id() const noexcept { return _id; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] bool matches(std::string_view path) const;

 private:
  std::string _id;
  std::string _pattern;
  std::regex _regex;
};

// Random RFC 4122 version 4 UUID, in its canonical lowercase 8-4-4-4-12 form.
std::string GenerateUuid();

}  // namespace restspy
