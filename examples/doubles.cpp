#include <cstdint>
#include <initializer_list>
#include <ios>
#include <iostream>
#include <string>

#include "restspy/double.hpp"
#include "restspy/external-server.hpp"
#include "restspy/features.hpp"
#include "restspy/local-server-config.hpp"
#include "restspy/local-server.hpp"
#include "restspy/matchable-registry.hpp"
#include "restspy/response.hpp"
#include "restspy/server-registry.hpp"

using namespace restspy;

// Usage: restspy-example-doubles [port] [rest-spy command]
//        restspy-example-doubles http://host:port/   (use an already running rest-spy server)
int main(int argc, char** argv) {
  std::cout << std::boolalpha << "spdlog: " << spdLogEnabled() << ", glaze: " << glazeEnabled()
            << ", gzip/deflate: " << zlibEnabled() << ", br: " << brotliEnabled() << ", zstd: " << zstdEnabled()
            << '\n';

  // In-memory doubles of port 4000: the last registered matching double wins.
  MatchableRegistry<Double> doubles;
  doubles.registerElement(Double("^/users/\\d+$", 200, {{"Content-Type", "application/json"}}, R"({"id":1})"), 4000);
  doubles.registerElement(Double("^/users/42$", 404), 4000);

  for (const char* path : {"/users/1", "/users/42", "/orders"}) {
    const Double* found = doubles.findForEndpoint(path, 4000);
    const Response response = found != nullptr ? Response::FromDouble(*found) : Response::NotFound();
    const auto repr = response.toRepresentation();
    std::cout << path << " -> " << repr.type << ' ' << repr.statusCode << ' ' << repr.body << '\n';
#ifdef RESTSPY_ENABLE_GLAZE
    std::cout << "  " << response.toJson() << '\n';
#endif
  }

  ServerRegistry registry;

  if (argc > 1 && std::string(argv[1]).starts_with("http://")) {
    ExternalServer server(argv[1]);
    if (server.start().hasError()) {
      return 1;
    }
    const auto result = server.get("/spy");
    std::cout << "GET /spy: " << (result.hasError() ? ErrorStr(result.error()) : result.body()) << '\n';
    server.stop();
    return 0;
  }

  LocalServerConfig config(argc > 1 ? static_cast<uint16_t>(std::stoi(argv[1])) : 1234);
  if (argc > 2) {
    config.withCommand(argv[2]);
  }
  LocalServer server(registry, config);

  const auto result = server.start();
  if (result.hasError()) {
    std::cerr << "Unable to start " << config.command << " on port " << config.port << ": "
              << ErrorStr(result.error()) << '\n';
    return 1;
  }
  std::cout << "Server running at " << server.baseUrl().str() << '\n';

  const auto posted = server.post("/doubles", R"({"pattern":"/test","body":"hello"})",
                                  {{"Content-Type", "application/json"}});
  if (posted) {
    std::cout << "POST /doubles: " << posted->statusCode << '\n';
  }

  // LocalServer stops its process on destruction.
  return 0;
}
