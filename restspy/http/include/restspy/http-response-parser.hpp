#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "restspy/http-client.hpp"

namespace restspy {

// Serialize a request as HTTP/1.1 with 'Connection: close'. Host and Content-Length headers are added.
std::string BuildRawRequest(const HttpClientRequest& request);

// Very small HTTP/1.x response parser for a response read until the peer closed the connection.
// Handles Content-Length and chunked framing (trailers ignored). Returns std::nullopt if the status line or the
// header block is incomplete or malformed, or if the body is shorter than announced.
std::optional<HttpClientResponse> ParseRawResponse(std::string_view raw);

}  // namespace restspy
