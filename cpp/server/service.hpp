#ifndef SERVER_SERVICE_HPP
#define SERVER_SERVICE_HPP

#include <kj/async.h>
#include <kj/compat/http.h>
#include <cstdint>
#include <string>

#include "server/executor.hpp"

namespace server {

// The HTTP face of the gateway: POST /execute, CORS and JSON replies.
class Service : public kj::HttpService {
 public:
  // Registers the headers the service needs in builder. The service must only
  // be used with the table builder produces.
  Service(kj::HttpHeaderTable::Builder* builder, Executor* executor,
          uint64_t max_body_size);
  KJ_DISALLOW_COPY(Service);

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& requestBody,
                            Response& response) override;

 private:
  kj::Promise<void> Execute(const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& body, Response& response);
  kj::Promise<void> Preflight(const kj::HttpHeaders& headers,
                              Response& response);

  // Sends a JSON reply with either output or error set.
  kj::Promise<void> ReplyOutput(Response& response, const std::string& output);
  kj::Promise<void> ReplyError(Response& response, kj::uint status,
                               kj::StringPtr message);
  kj::Promise<void> Reply(Response& response, kj::uint status,
                          kj::String body);

  const kj::HttpHeaderTable& table_;
  Executor& executor_;
  const uint64_t max_body_size_;

  kj::HttpHeaderId allow_origin_;
  kj::HttpHeaderId allow_methods_;
  kj::HttpHeaderId allow_headers_;
  kj::HttpHeaderId request_headers_;
  kj::HttpHeaderId vary_;
};

// Reads all of body. Resolves to nullptr once it exceeds limit bytes.
kj::Promise<kj::Maybe<std::string>> ReadBody(kj::AsyncInputStream* body,
                                             uint64_t limit);

// Whether a Content-Type header value is the JSON media type.
bool IsJsonContentType(kj::StringPtr content_type);

}  // namespace server

#endif
