#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "restspy/http-client.hpp"
#include "restspy/http-status-code.hpp"

namespace restspy::test {

// Scriptable HttpClient recording every performed request.
// The shared state outlives the client so that tests can inspect it after handing the client over to a server.
class FakeHttpClient : public HttpClient {
 public:
  using Handler = std::function<HttpClientResult(const HttpClientRequest&)>;

  struct State {
    [[nodiscard]] std::vector<std::string> performedUrls() const {
      std::scoped_lock lock(mutex);
      std::vector<std::string> urls;
      for (const auto& req : requests) {
        urls.push_back(std::string(req.method) + ' ' + req.url.str());
      }
      return urls;
    }

    [[nodiscard]] std::size_t nbRequests() const {
      std::scoped_lock lock(mutex);
      return requests.size();
    }

    void setHandler(Handler newHandler) {
      std::scoped_lock lock(mutex);
      handler = std::move(newHandler);
    }

    mutable std::mutex mutex;
    std::vector<HttpClientRequest> requests;
    Handler handler;
  };

  // Every request answers 'result'.
  static Handler Always(HttpClientResult result) {
    return [result = std::move(result)](const HttpClientRequest&) { return result; };
  }

  // Every request fails with 'error'.
  static Handler Failing(HttpClientResult::Error error = HttpClientResult::Error::ConnectionFailure) {
    return Always(HttpClientResult(error));
  }

  static HttpClientResponse Status(http::StatusCode statusCode, std::string body = {}) {
    return HttpClientResponse{statusCode, {}, {}, std::move(body)};
  }

  explicit FakeHttpClient(Handler handler = Failing()) : _state(std::make_shared<State>()) {
    _state->handler = std::move(handler);
  }

  [[nodiscard]] std::shared_ptr<State> state() const { return _state; }

  HttpClientResult perform(const HttpClientRequest& request) override {
    Handler handler;
    {
      std::scoped_lock lock(_state->mutex);
      _state->requests.push_back(request);
      handler = _state->handler;
    }
    return handler(request);
  }

 private:
  std::shared_ptr<State> _state;
};

}  // namespace restspy::test
