#pragma once

#ifdef RESTSPY_ENABLE_GLAZE

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace restspy {

// Serialize 'obj' to a JSON string with glaze. T needs to be reflectable by glaze, or to provide a glz::meta
// specialization. Returns an empty string if serialization fails.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace restspy

#endif  // RESTSPY_ENABLE_GLAZE
