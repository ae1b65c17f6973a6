#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "restspy/matchable.hpp"

namespace restspy {

// Per-port ordered collection of matchables with last-registered-wins lookup.
// Registration order is kept until an element is removed, and removal never reorders the others.
// Not synchronized: a registry instance must be confined to a single thread or externally locked.
template <std::derived_from<Matchable> T = Matchable>
class MatchableRegistry {
 public:
  using value_type = T;

  // Append 'element' to the elements of 'port'. No uniqueness check is made on id or pattern.
  void registerElement(T element, uint16_t port) { _elementsPerPort[port].push_back(std::move(element)); }

  // Remove all elements of 'port' whose id is 'id'. Returns the number of removed elements.
  std::size_t unregister(std::string_view id, uint16_t port) {
    auto it = _elementsPerPort.find(port);
    if (it == _elementsPerPort.end()) {
      return 0;
    }
    return std::erase_if(it->second, [id](const T& elem) { return elem.id() == id; });
  }

  // Remove all elements of 'port'.
  void reset(uint16_t port) { _elementsPerPort.erase(port); }

  // Last registered element of 'port' matching 'path', or nullptr.
  // The returned pointer is invalidated by any modification of the registry.
  [[nodiscard]] const T* findForEndpoint(std::string_view path, uint16_t port) const {
    auto it = _elementsPerPort.find(port);
    if (it == _elementsPerPort.end()) {
      return nullptr;
    }
    auto found =
        std::find_if(it->second.rbegin(), it->second.rend(), [path](const T& elem) { return elem.matches(path); });
    return found == it->second.rend() ? nullptr : &*found;
  }

  // All elements of 'port' matching 'path', in registration order.
  [[nodiscard]] std::vector<const T*> findAllForEndpoint(std::string_view path, uint16_t port) const {
    std::vector<const T*> ret;
    auto it = _elementsPerPort.find(port);
    if (it != _elementsPerPort.end()) {
      for (const T& elem : it->second) {
        if (elem.matches(path)) {
          ret.push_back(&elem);
        }
      }
    }
    return ret;
  }

  [[nodiscard]] std::size_t size(uint16_t port) const {
    auto it = _elementsPerPort.find(port);
    return it == _elementsPerPort.end() ? 0 : it->second.size();
  }

  void clear() noexcept { _elementsPerPort.clear(); }

 private:
  std::unordered_map<uint16_t, std::vector<T>> _elementsPerPort;
};

}  // namespace restspy
