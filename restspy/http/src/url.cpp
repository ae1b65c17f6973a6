#include "restspy/url.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "restspy/invalid_argument_exception.hpp"
#include "restspy/string-equal-ignore-case.hpp"

namespace restspy {

namespace {
constexpr std::string_view kHttpScheme = "http://";

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), followed by ':' before any '/', '?' or '#'
bool HasScheme(std::string_view ref) {
  const auto colonPos = ref.find(':');
  if (colonPos == 0 || colonPos == std::string_view::npos || ref.find_first_of("/?#") < colonPos) {
    return false;
  }
  const auto isAlpha = [](char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); };
  if (!isAlpha(ref.front())) {
    return false;
  }
  for (char ch : ref.substr(1, colonPos - 1)) {
    if (!isAlpha(ch) && !(ch >= '0' && ch <= '9') && ch != '+' && ch != '-' && ch != '.') {
      return false;
    }
  }
  return true;
}

void RemoveLastSegment(std::string& out) {
  const auto slashPos = out.rfind('/');
  out.resize(slashPos == std::string::npos ? 0 : slashPos);
}

// RFC 3986 §5.2.4
std::string RemoveDotSegments(std::string_view path) {
  std::string out;
  out.reserve(path.size());
  while (!path.empty()) {
    if (path.starts_with("../")) {
      path.remove_prefix(3);
    } else if (path.starts_with("./")) {
      path.remove_prefix(2);
    } else if (path.starts_with("/./")) {
      path.remove_prefix(2);
    } else if (path == "/.") {
      path = "/";
    } else if (path.starts_with("/../")) {
      path.remove_prefix(3);
      RemoveLastSegment(out);
    } else if (path == "/..") {
      path = "/";
      RemoveLastSegment(out);
    } else if (path == "." || path == "..") {
      path = {};
    } else {
      const auto nextSlash = path.find('/', 1);
      const auto segmentLen = nextSlash == std::string_view::npos ? path.size() : nextSlash;
      out.append(path.substr(0, segmentLen));
      path.remove_prefix(segmentLen);
    }
  }
  if (out.empty() || out.front() != '/') {
    out.insert(out.begin(), '/');
  }
  return out;
}

// 'path[?query]' with dot segments removed from path
std::string NormalizeTarget(std::string_view target) {
  const auto queryPos = target.find('?');
  std::string ret = RemoveDotSegments(target.substr(0, queryPos));
  if (queryPos != std::string_view::npos) {
    ret.append(target.substr(queryPos));
  }
  return ret;
}

}  // namespace

Url Url::Parse(std::string_view url) {
  if (!StartsWithCaseInsensitive(url, kHttpScheme)) {
    throw invalid_argument("Unsupported URL '{}', only http:// is supported", url);
  }
  std::string_view rest = url.substr(kHttpScheme.size());
  const auto targetPos = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, targetPos);
  std::string target(targetPos == std::string_view::npos ? std::string_view("/") : rest.substr(targetPos));
  if (target.front() == '?') {
    target.insert(target.begin(), '/');
  }
  if (const auto fragmentPos = target.find('#'); fragmentPos != std::string::npos) {
    target.resize(fragmentPos);
  }

  uint16_t port = kDefaultHttpPort;
  std::string_view host = authority;
  if (!authority.empty() && authority.front() == '[') {
    // IPv6 literal
    const auto closing = authority.find(']');
    if (closing == std::string_view::npos) {
      throw invalid_argument("Invalid IPv6 host in URL '{}'", url);
    }
    host = authority.substr(1, closing - 1);
    authority.remove_prefix(closing + 1);
    if (!authority.empty() && authority.front() != ':') {
      throw invalid_argument("Invalid authority in URL '{}'", url);
    }
  } else {
    const auto colonPos = authority.find(':');
    host = authority.substr(0, colonPos);
    authority.remove_prefix(colonPos == std::string_view::npos ? authority.size() : colonPos);
  }
  if (!authority.empty()) {
    // authority is now ":port"
    const std::string_view portStr = authority.substr(1);
    const auto [ptr, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
    if (portStr.empty() || ec != std::errc{} || ptr != portStr.data() + portStr.size() || port == 0) {
      throw invalid_argument("Invalid port in URL '{}'", url);
    }
  }
  if (host.empty()) {
    throw invalid_argument("Missing host in URL '{}'", url);
  }
  return {std::string(host), port, std::move(target)};
}

Url Url::join(std::string_view endpoint) const {
  endpoint = endpoint.substr(0, endpoint.find('#'));
  if (endpoint.empty()) {
    return {_host, _port, _target};
  }
  if (HasScheme(endpoint)) {
    Url url = Parse(endpoint);
    url._target = NormalizeTarget(url._target);
    return url;
  }
  if (endpoint.starts_with("//")) {
    Url url = Parse(std::string("http:").append(endpoint));
    url._target = NormalizeTarget(url._target);
    return url;
  }
  if (endpoint.front() == '/') {
    return {_host, _port, NormalizeTarget(endpoint)};
  }
  std::string_view basePath = std::string_view(_target).substr(0, _target.find('?'));
  if (endpoint.front() == '?') {
    return {_host, _port, std::string(basePath).append(endpoint)};
  }
  basePath = basePath.substr(0, basePath.rfind('/') + 1);
  return {_host, _port, NormalizeTarget(std::string(basePath).append(endpoint))};
}

std::string Url::authority() const {
  std::string ret;
  const bool ipv6 = _host.find(':') != std::string::npos;
  if (ipv6) {
    ret.push_back('[');
  }
  ret.append(_host);
  if (ipv6) {
    ret.push_back(']');
  }
  if (_port != kDefaultHttpPort) {
    ret.push_back(':');
    ret.append(std::to_string(_port));
  }
  return ret;
}

std::string Url::str() const { return std::string(kHttpScheme).append(authority()).append(_target); }

}  // namespace restspy
