#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace restspy {

// Minimal http URL: "http://host[:port][/path][?query]".
// Only the plain http scheme is supported, which is all a test double listening on loopback needs.
class Url {
 public:
  static constexpr uint16_t kDefaultHttpPort = 80;

  // Throws restspy::invalid_argument if url is not a valid http URL.
  static Url Parse(std::string_view url);

  // Resolve the reference 'endpoint' against this URL (RFC 3986 §5.2):
  //  - an absolute 'http://...' URL replaces everything,
  //  - a network-path reference '//host[:port]...' keeps the scheme only,
  //  - an endpoint starting with '/' replaces the path,
  //  - a relative endpoint replaces the last segment of the path,
  //  - an endpoint starting with '?' keeps the path and replaces the query,
  //  - an empty endpoint (or a fragment only) returns this URL unchanged.
  // Otherwise the query of the endpoint, if any, is kept and the query of this URL is dropped.
  // '.' and '..' segments of the resulting path are removed (RFC 3986 §5.2.4) and fragments are dropped.
  // Throws restspy::invalid_argument if 'endpoint' is an absolute URL of another scheme, or an invalid one.
  [[nodiscard]] Url join(std::string_view endpoint) const;

  [[nodiscard]] std::string_view host() const noexcept { return _host; }

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Path and query, as sent in the request line. Never empty.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Value of the Host header.
  [[nodiscard]] std::string authority() const;

  [[nodiscard]] std::string str() const;

  bool operator==(const Url&) const noexcept = default;

 private:
  Url(std::string host, uint16_t port, std::string target)
      : _host(std::move(host)), _target(std::move(target)), _port(port) {}

  std::string _host;
  std::string _target;
  uint16_t _port{kDefaultHttpPort};
};

}  // namespace restspy
