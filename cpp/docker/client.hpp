#ifndef DOCKER_CLIENT_HPP
#define DOCKER_CLIENT_HPP

#include <kj/async.h>
#include <kj/compat/http.h>
#include <string>
#include <utility>

#include "docker/runtime.hpp"

namespace docker {

// Implementation of ContainerRuntime on top of the Docker Engine HTTP API.
// Concurrent calls are fine as long as the underlying HttpClient opens a
// connection per request, which is what kj::newHttpClient does for a
// NetworkAddress.
class Client : public ContainerRuntime {
 public:
  // table must be the header table http reads responses with.
  Client(kj::HttpClient* http, const kj::HttpHeaderTable& table)
      : http_(*http), table_(table) {}
  KJ_DISALLOW_COPY(Client);

  kj::Promise<bool> HasImage(const std::string& image) override;
  kj::Promise<void> PullImage(const std::string& image) override;
  kj::Promise<std::string> CreateContainer(const ContainerSpec& spec) override;
  kj::Promise<kj::Own<AttachedOutput>> Attach(const std::string& id) override;
  kj::Promise<void> Start(const std::string& id) override;
  kj::Promise<kj::Maybe<int64_t>> Wait(const std::string& id) override;
  kj::Promise<void> Remove(const std::string& id) override;

  // Converts a daemon address in any of the forms DOCKER_HOST accepts
  // (unix:///path, tcp://host:port, ...) to one kj::Network::parseAddress
  // understands. An empty host means the default local socket.
  static std::string ParseHost(const std::string& host);

  // Splits an image reference into repository and tag (or digest), as the
  // pull endpoint wants them. The tag defaults to "latest".
  static std::pair<std::string, std::string> SplitReference(
      const std::string& image);

 private:
  struct Reply {
    kj::uint status = 0;
    std::string body;
  };

  kj::Promise<kj::HttpClient::Response> Send(kj::HttpMethod method,
                                             kj::String path,
                                             kj::Maybe<kj::String> body);
  kj::Promise<Reply> Call(kj::HttpMethod method, kj::String path,
                          kj::Maybe<kj::String> body = nullptr);

  kj::HttpClient& http_;
  const kj::HttpHeaderTable& table_;
};

}  // namespace docker

#endif
