#include "server/service.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <algorithm>
#include <cctype>

#include "capnp/gateway.capnp.h"
#include "server/languages.hpp"
#include "util/json.hpp"
#include "util/misc.hpp"

namespace server {

namespace {

const constexpr char* kJsonType = "application/json; charset=utf-8";
const constexpr char* kAllowedMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";
const constexpr size_t kChunkSize = 4096;

kj::StringPtr StatusText(kj::uint status) {
  switch (status) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 413:
      return "Payload Too Large";
    default:
      return "Internal Server Error";
  }
}

struct BodyBuffer {
  std::string data;
  kj::byte chunk[kChunkSize];
};

kj::Promise<kj::Maybe<std::string>> ReadMore(kj::AsyncInputStream& body,
                                             uint64_t limit,
                                             BodyBuffer& buffer) {
  return body.tryRead(buffer.chunk, 1, kChunkSize)
      .then([&body, limit,
             &buffer](size_t n) -> kj::Promise<kj::Maybe<std::string>> {
        if (n == 0) return kj::Maybe<std::string>(kj::mv(buffer.data));
        if (buffer.data.size() + n > limit) {
          return kj::Maybe<std::string>(nullptr);
        }
        buffer.data.append(reinterpret_cast<const char*>(buffer.chunk), n);
        return ReadMore(body, limit, buffer);
      });
}

}  // namespace

kj::Promise<kj::Maybe<std::string>> ReadBody(kj::AsyncInputStream* body,
                                             uint64_t limit) {
  auto length = body->tryGetLength();
  KJ_IF_MAYBE(l, length) {
    if (*l > limit) return kj::Maybe<std::string>(nullptr);
  }
  auto buffer = kj::heap<BodyBuffer>();
  auto& ref = *buffer;
  return ReadMore(*body, limit, ref).attach(kj::mv(buffer));
}

bool IsJsonContentType(kj::StringPtr content_type) {
  std::string type = content_type.cStr();
  type = util::trim(type.substr(0, type.find(';')));
  std::transform(type.begin(), type.end(), type.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return type == "application/json";
}

Service::Service(kj::HttpHeaderTable::Builder* builder, Executor* executor,
                 uint64_t max_body_size)
    : table_(builder->getFutureTable()),
      executor_(*executor),
      max_body_size_(max_body_size),
      allow_origin_(builder->add("Access-Control-Allow-Origin")),
      allow_methods_(builder->add("Access-Control-Allow-Methods")),
      allow_headers_(builder->add("Access-Control-Allow-Headers")),
      request_headers_(builder->add("Access-Control-Request-Headers")),
      vary_(builder->add("Vary")) {}

kj::Promise<void> Service::request(kj::HttpMethod method, kj::StringPtr url,
                                   const kj::HttpHeaders& headers,
                                   kj::AsyncInputStream& requestBody,
                                   Response& response) {
  std::string path = url.cStr();
  path = path.substr(0, path.find('?'));
  if (method == kj::HttpMethod::OPTIONS) return Preflight(headers, response);
  if (method == kj::HttpMethod::POST &&
      (path == "/execute" || path == "/execute/")) {
    return Execute(headers, requestBody, response);
  }
  return ReplyError(response, 404,
                    kj::str("Cannot ", method, " ", path.c_str()));
}

kj::Promise<void> Service::Execute(const kj::HttpHeaders& headers,
                                   kj::AsyncInputStream& body,
                                   Response& response) {
  bool json = false;
  auto content_type = headers.get(kj::HttpHeaderId::CONTENT_TYPE);
  KJ_IF_MAYBE(type, content_type) { json = IsJsonContentType(*type); }

  return ReadBody(&body, max_body_size_)
      .then([this, json, &response](
                kj::Maybe<std::string> maybe_text) -> kj::Promise<void> {
        std::string text;
        KJ_IF_MAYBE(t, maybe_text) {
          text = kj::mv(*t);
        } else {
          return ReplyError(response, 413, "Request body too large.");
        }

        // Anything that is not a JSON body counts as an empty object.
        kj::Own<util::JsonDocument> doc = kj::heap<util::JsonDocument>("{}");
        if (json && !util::trim(text).empty()) {
          auto invalid = kj::runCatchingExceptions([&]() {
            doc = kj::heap<util::JsonDocument>(
                kj::StringPtr(text.c_str(), text.size()));
          });
          KJ_IF_MAYBE(exc, invalid) {
            KJ_LOG(WARNING, "Rejecting invalid JSON body", *exc);
            return ReplyError(response, 400, "Invalid JSON body.");
          }
        }
        auto root = doc->Root();

        bool has_language = false;
        auto language_field = util::GetField(root, "language");
        KJ_IF_MAYBE(field, language_field) {
          has_language = util::IsTruthy(*field);
        }
        bool has_code = false;
        auto code_field = util::GetField(root, "code");
        KJ_IF_MAYBE(field, code_field) {
          has_code = field->isString() && util::IsTruthy(*field);
        }
        if (!has_language || !has_code) {
          return ReplyError(response, 400, "Language and code are required.");
        }

        kj::Maybe<const Language&> language = nullptr;
        auto name = util::GetString(root, "language");
        KJ_IF_MAYBE(n, name) { language = FindLanguage(*n); }
        KJ_IF_MAYBE(lang, language) {
          auto code_text = KJ_ASSERT_NONNULL(code_field).getString();
          std::string code(code_text.begin(), code_text.size());
          return executor_.Execute(*lang, kj::mv(code))
              .then(
                  [this, &response](std::string output) {
                    return ReplyOutput(response, output);
                  },
                  [this, &response](kj::Exception exc) {
                    return ReplyError(response, 500, exc.getDescription());
                  });
        }
        return ReplyError(response, 400, "Unsupported language.");
      });
}

kj::Promise<void> Service::Preflight(const kj::HttpHeaders& headers,
                                     Response& response) {
  kj::HttpHeaders reply(table_);
  reply.set(allow_origin_, "*");
  reply.set(allow_methods_, kAllowedMethods);
  auto requested = headers.get(request_headers_);
  KJ_IF_MAYBE(r, requested) {
    reply.set(allow_headers_, *r);
    reply.set(vary_, "Access-Control-Request-Headers");
  }
  response.send(204, StatusText(204), reply, uint64_t(0));
  return kj::READY_NOW;
}

kj::Promise<void> Service::ReplyOutput(Response& response,
                                       const std::string& output) {
  capnp::MallocMessageBuilder message;
  auto reply = message.initRoot<capnproto::ExecuteReply>();
  reply.setOutput(capnp::Text::Reader(output.c_str(), output.size()));
  capnp::JsonCodec codec;
  return Reply(response, 200, codec.encode(reply.asReader()));
}

kj::Promise<void> Service::ReplyError(Response& response,
                                      kj::uint status,
                                      kj::StringPtr message) {
  capnp::MallocMessageBuilder message_builder;
  auto reply = message_builder.initRoot<capnproto::ExecuteReply>();
  reply.setError(message);
  capnp::JsonCodec codec;
  return Reply(response, status, codec.encode(reply.asReader()));
}

kj::Promise<void> Service::Reply(Response& response, kj::uint status,
                                 kj::String body) {
  kj::HttpHeaders headers(table_);
  headers.set(allow_origin_, "*");
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, kJsonType);
  auto stream = response.send(status, StatusText(status), headers,
                              uint64_t(body.size()));
  auto& out = *stream;
  auto written = out.write(body.begin(), body.size());
  return written.attach(kj::mv(stream), kj::mv(body));
}

}  // namespace server
