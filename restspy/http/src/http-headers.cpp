#include "restspy/http-headers.hpp"

#include <optional>
#include <string_view>

#include "restspy/string-equal-ignore-case.hpp"

namespace restspy::http {

std::optional<std::string_view> FindHeader(const Headers& headers, std::string_view name) {
  for (const auto& [headerName, value] : headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

}  // namespace restspy::http
