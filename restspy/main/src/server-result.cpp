#include "restspy/server-result.hpp"

#include <string_view>

namespace restspy {

std::string_view ErrorStr(ServerResult::Error error) {
  switch (error) {
    case ServerResult::Error::None:
      return "none";
    case ServerResult::Error::DuplicatePort:
      return "duplicate port";
    case ServerResult::Error::Timeout:
      return "timeout";
    case ServerResult::Error::HttpStatus:
      return "unexpected HTTP status";
    case ServerResult::Error::ConnectionFailure:
      return "connection failure";
    case ServerResult::Error::InvalidResponse:
      return "invalid response";
    case ServerResult::Error::SpawnFailure:
      return "spawn failure";
    default:
      return "unknown";
  }
}

}  // namespace restspy
