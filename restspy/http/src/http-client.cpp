#include "restspy/http-client.hpp"

#include <string_view>

namespace restspy {

std::string_view ErrorStr(HttpClientResult::Error error) {
  switch (error) {
    case HttpClientResult::Error::None:
      return "none";
    case HttpClientResult::Error::ConnectionFailure:
      return "connection failure";
    case HttpClientResult::Error::Timeout:
      return "timeout";
    case HttpClientResult::Error::InvalidResponse:
      return "invalid response";
    default:
      return "unknown";
  }
}

}  // namespace restspy
