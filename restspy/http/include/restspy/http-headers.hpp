#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restspy::http {

// Ordered list of header fields as received or to be sent. Names keep their original case.
using Headers = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive lookup of the first header named 'name'.
std::optional<std::string_view> FindHeader(const Headers& headers, std::string_view name);

}  // namespace restspy::http
