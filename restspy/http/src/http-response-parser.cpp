#include "restspy/http-response-parser.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "restspy/http-client.hpp"
#include "restspy/http-constants.hpp"
#include "restspy/http-headers.hpp"
#include "restspy/string-equal-ignore-case.hpp"
#include "restspy/string-trim.hpp"

namespace restspy {

namespace {

std::optional<std::string> Dechunk(std::string_view raw) {
  std::string out;
  std::size_t cursor = 0;
  while (cursor < raw.size()) {
    const auto lineEnd = raw.find(http::CRLF, cursor);
    if (lineEnd == std::string_view::npos) {
      return std::nullopt;
    }
    std::string_view sizeLine = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    // size may include optional chunk extensions after ';'
    sizeLine = TrimOws(sizeLine.substr(0, sizeLine.find(';')));
    std::size_t sz = 0;
    const char* first = sizeLine.data();
    const char* last = first + sizeLine.size();
    const auto conv = std::from_chars(first, last, sz, 16);
    if (sizeLine.empty() || conv.ec != std::errc() || conv.ptr != last) {
      return std::nullopt;
    }
    if (sz == 0) {
      return out;
    }
    // chunk data and its trailing CRLF must fit in what remains
    const std::size_t remaining = raw.size() - cursor;
    if (remaining < http::CRLF.size() || sz > remaining - http::CRLF.size()) {
      return std::nullopt;
    }
    out.append(raw.substr(cursor, sz));
    cursor += sz;
    if (raw.substr(cursor, http::CRLF.size()) != http::CRLF) {
      return std::nullopt;
    }
    cursor += http::CRLF.size();
  }
  return std::nullopt;  // missing last chunk
}

}  // namespace

std::string BuildRawRequest(const HttpClientRequest& request) {
  std::string req;
  req.reserve(256 + request.body.size());
  req.append(request.method).append(" ").append(request.url.target()).append(" ").append(http::HTTP11Sv);
  req.append(http::CRLF);
  req.append(http::Host).append(http::HeaderSep).append(request.url.authority()).append(http::CRLF);
  req.append(http::Connection).append(http::HeaderSep).append(http::close).append(http::CRLF);
  for (const auto& [name, value] : request.headers) {
    req.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  if (!request.body.empty() || request.method == http::POST) {
    req.append(http::ContentLength).append(http::HeaderSep).append(std::to_string(request.body.size()));
    req.append(http::CRLF);
  }
  req.append(http::CRLF);
  req.append(request.body);
  return req;
}

std::optional<HttpClientResponse> ParseRawResponse(std::string_view raw) {
  const auto headerEnd = raw.find(http::DoubleCRLF);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view head = raw.substr(0, headerEnd + http::CRLF.size());
  const std::string_view bodyRaw = raw.substr(headerEnd + http::DoubleCRLF.size());

  // Expect: HTTP/1.x <code> [<reason>]
  const auto statusLineEnd = head.find(http::CRLF);
  const std::string_view statusLine = head.substr(0, statusLineEnd);
  if (!statusLine.starts_with("HTTP/1.")) {
    return std::nullopt;
  }
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  HttpClientResponse response;
  const std::string_view codeStr = statusLine.substr(firstSpace + 1, 3);
  const auto [ptr, ec] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), response.statusCode);
  if (ec != std::errc{} || ptr != codeStr.data() + codeStr.size() || response.statusCode < 100) {
    return std::nullopt;
  }
  if (statusLine.size() > firstSpace + 5) {
    response.reason = statusLine.substr(firstSpace + 5);
  }

  std::size_t cursor = statusLineEnd + http::CRLF.size();
  while (cursor < head.size()) {
    const auto lineEnd = head.find(http::CRLF, cursor);
    const std::string_view line = head.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return std::nullopt;
    }
    response.headers.emplace_back(line.substr(0, colon), TrimOws(line.substr(colon + 1)));
  }

  const auto transferEncoding = http::FindHeader(response.headers, http::TransferEncoding);
  if (transferEncoding && CaseInsensitiveEqual(TrimOws(*transferEncoding), http::chunked)) {
    auto body = Dechunk(bodyRaw);
    if (!body) {
      return std::nullopt;
    }
    response.body = std::move(*body);
    return response;
  }

  const auto contentLength = http::FindHeader(response.headers, http::ContentLength);
  if (contentLength) {
    std::size_t length = 0;
    const auto [lenPtr, lenEc] =
        std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), length);
    if (lenEc != std::errc{} || lenPtr != contentLength->data() + contentLength->size() || bodyRaw.size() < length) {
      return std::nullopt;
    }
    response.body = bodyRaw.substr(0, length);
    return response;
  }

  // No framing: the body is delimited by the connection close.
  response.body = bodyRaw;
  return response;
}

}  // namespace restspy
