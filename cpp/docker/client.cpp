#include "docker/client.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/encoding.h>

#include "capnp/docker.capnp.h"
#include "docker/stream_demuxer.hpp"
#include "util/json.hpp"

namespace docker {

namespace {

const constexpr char* kDefaultHost = "unix:/var/run/docker.sock";
const constexpr size_t kReadSize = 4096;

kj::Exception ApiError(kj::StringPtr what, kj::uint status,
                       const std::string& body) {
  // Errors come as {"message": "..."}, but keep the raw body otherwise.
  std::string message = body;
  auto not_json = kj::runCatchingExceptions([&]() {
    util::JsonDocument doc(body.c_str());
    auto field = util::GetString(doc.Root(), "message");
    KJ_IF_MAYBE(m, field) { message = m->cStr(); }
  });
  if (not_json != nullptr) message = body;
  while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
    message.pop_back();
  return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str(what, " (HTTP ", status, "): ",
                               message.c_str()));
}

kj::String Encode(kj::StringPtr s) { return kj::encodeUriComponent(s); }

// Output of a container, read from a multiplexed attach stream.
class Attachment : public AttachedOutput {
 public:
  explicit Attachment(kj::Own<kj::AsyncInputStream> stream)
      : stream_(kj::mv(stream)) {}

  kj::Promise<std::string> Collect() override {
    return Pump().then([this]() {
      if (demuxer_.HasPartialFrame()) {
        KJ_LOG(WARNING, "Attach stream ended in the middle of a frame");
      }
      return demuxer_.Combined();
    });
  }

 private:
  kj::Promise<void> Pump() {
    return stream_->tryRead(buffer_, 1, kReadSize)
        .then([this](size_t n) -> kj::Promise<void> {
          if (n == 0) return kj::READY_NOW;
          demuxer_.Feed(kj::arrayPtr(buffer_, n));
          return Pump();
        });
  }

  kj::Own<kj::AsyncInputStream> stream_;
  StreamDemuxer demuxer_;
  kj::byte buffer_[kReadSize];
};

}  // namespace

std::string Client::ParseHost(const std::string& host) {
  if (host.empty()) return kDefaultHost;
  std::string address = host;
  for (const char* scheme : {"tcp://", "http://"}) {
    std::string prefix = scheme;
    if (address.compare(0, prefix.size(), prefix) == 0) {
      address = address.substr(prefix.size());
      while (!address.empty() && address.back() == '/') address.pop_back();
      return address;
    }
  }
  const std::string unix_prefix = "unix://";
  if (address.compare(0, unix_prefix.size(), unix_prefix) == 0) {
    return "unix:" + address.substr(unix_prefix.size());
  }
  return address;
}

std::pair<std::string, std::string> Client::SplitReference(
    const std::string& image) {
  size_t at = image.find('@');
  if (at != std::string::npos) {
    return {image.substr(0, at), image.substr(at + 1)};
  }
  size_t colon = image.rfind(':');
  size_t slash = image.rfind('/');
  // A colon before the last slash separates a registry port, not a tag.
  if (colon == std::string::npos ||
      (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

kj::Promise<kj::HttpClient::Response> Client::Send(kj::HttpMethod method,
                                                   kj::String path,
                                                   kj::Maybe<kj::String> body) {
  kj::HttpHeaders headers(table_);
  // The daemon wants a Host header, but ignores its value.
  headers.set(kj::HttpHeaderId::HOST, "docker");
  uint64_t size = 0;
  KJ_IF_MAYBE(b, body) {
    headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
    size = b->size();
  }
  auto request = http_.request(method, path, headers, size);
  kj::Promise<void> sent = kj::READY_NOW;
  KJ_IF_MAYBE(b, body) {
    auto& stream = *request.body;
    auto written = stream.write(b->begin(), b->size());
    sent = written.attach(kj::mv(request.body), kj::mv(*b));
  } else {
    request.body = nullptr;
  }
  return sent.then([response = kj::mv(request.response)]() mutable {
    return kj::mv(response);
  });
}

kj::Promise<Client::Reply> Client::Call(kj::HttpMethod method, kj::String path,
                                        kj::Maybe<kj::String> body) {
  return Send(method, kj::mv(path), kj::mv(body))
      .then([](kj::HttpClient::Response response) {
        auto stream = kj::mv(response.body);
        auto text = stream->readAllText();
        return text.attach(kj::mv(stream))
            .then([status = response.statusCode](kj::String text) {
              Reply reply;
              reply.status = status;
              reply.body = std::string(text.begin(), text.size());
              return reply;
            });
      });
}

kj::Promise<bool> Client::HasImage(const std::string& image) {
  capnp::MallocMessageBuilder message;
  auto filters = message.initRoot<capnproto::ImageFilters>();
  filters.initReference(1).set(0, image.c_str());
  capnp::JsonCodec codec;
  auto path = kj::str("/images/json?filters=",
                      Encode(codec.encode(filters.asReader())));
  return Call(kj::HttpMethod::GET, kj::mv(path))
      .then([image](Reply reply) {
        if (reply.status != 200) {
          throw ApiError(kj::str("Failed to list images ", image.c_str()),
                         reply.status, reply.body);
        }
        util::JsonDocument doc(reply.body.c_str());
        auto root = doc.Root();
        KJ_REQUIRE(root.isArray(), "Unexpected reply listing images",
                   reply.body);
        return root.getArray().size() > 0;
      });
}

kj::Promise<void> Client::PullImage(const std::string& image) {
  auto ref = SplitReference(image);
  auto path = kj::str("/images/create?fromImage=", Encode(ref.first.c_str()),
                      "&tag=", Encode(ref.second.c_str()));
  return Call(kj::HttpMethod::POST, kj::mv(path))
      .then([image](Reply reply) {
        if (reply.status != 200) {
          throw ApiError(kj::str("Failed to pull image ", image.c_str()),
                         reply.status, reply.body);
        }
        // The reply is a stream of JSON progress messages, one per line. A
        // failed pull still answers 200 and reports the error in the stream.
        size_t begin = 0;
        while (begin < reply.body.size()) {
          size_t end = reply.body.find('\n', begin);
          if (end == std::string::npos) end = reply.body.size();
          std::string line = reply.body.substr(begin, end - begin);
          begin = end + 1;
          if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
          kj::Maybe<std::string> error;
          auto parsed = kj::runCatchingExceptions([&]() {
            util::JsonDocument doc(line.c_str());
            auto field = util::GetField(doc.Root(), "error");
            KJ_IF_MAYBE(e, field) {
              if (util::IsTruthy(*e)) {
                error = e->isString() ? std::string(e->getString().cStr())
                                      : std::string("unknown error");
              }
            }
          });
          if (parsed != nullptr) {
            KJ_LOG(WARNING, "Ignoring malformed pull progress", line);
            continue;
          }
          KJ_IF_MAYBE(e, error) {
            throw kj::Exception(
                kj::Exception::Type::FAILED, __FILE__, __LINE__,
                kj::str("Failed to pull image ", image.c_str(), ": ",
                        e->c_str()));
          }
        }
      });
}

kj::Promise<std::string> Client::CreateContainer(const ContainerSpec& spec) {
  capnp::MallocMessageBuilder message;
  auto config = message.initRoot<capnproto::ContainerConfig>();
  config.setImage(spec.image.c_str());
  auto cmd = config.initCmd(spec.command.size());
  for (size_t i = 0; i < spec.command.size(); i++) {
    cmd.set(i, capnp::Text::Reader(spec.command[i].c_str(),
                                   spec.command[i].size()));
  }
  config.setTty(false);
  config.setAttachStdin(false);
  config.setAttachStdout(true);
  config.setAttachStderr(true);
  config.setOpenStdin(false);
  config.setNetworkDisabled(spec.network_mode == "none");
  auto host_config = config.initHostConfig();
  host_config.setCpuShares(spec.cpu_shares);
  host_config.setMemory(spec.memory_bytes);
  host_config.setNetworkMode(spec.network_mode.c_str());

  capnp::JsonCodec codec;
  codec.handleByAnnotation<capnproto::ContainerConfig>();
  kj::String body = codec.encode(config.asReader());
  return Call(kj::HttpMethod::POST, kj::str("/containers/create"),
              kj::mv(body))
      .then([image = spec.image](Reply reply) {
        if (reply.status != 201) {
          throw ApiError(
              kj::str("Failed to create container from ", image.c_str()),
              reply.status, reply.body);
        }
        util::JsonDocument doc(reply.body.c_str());
        auto id = util::GetString(doc.Root(), "Id");
        KJ_IF_MAYBE(i, id) {
          auto warnings = util::GetField(doc.Root(), "Warnings");
          KJ_IF_MAYBE(w, warnings) {
            if (w->isArray()) {
              for (auto warning : w->getArray()) {
                if (warning.isString()) {
                  KJ_LOG(WARNING, "Docker", warning.getString());
                }
              }
            }
          }
          return std::string(i->cStr());
        }
        KJ_FAIL_REQUIRE("Container created without an id", reply.body);
      });
}

kj::Promise<kj::Own<AttachedOutput>> Client::Attach(const std::string& id) {
  auto path =
      kj::str("/containers/", id.c_str(), "/attach?stream=1&stdout=1&stderr=1");
  return Send(kj::HttpMethod::POST, kj::mv(path), nullptr)
      .then([id](kj::HttpClient::Response response)
                -> kj::Promise<kj::Own<AttachedOutput>> {
        if (response.statusCode == 200 || response.statusCode == 101) {
          kj::Own<AttachedOutput> output =
              kj::heap<Attachment>(kj::mv(response.body));
          return kj::mv(output);
        }
        auto stream = kj::mv(response.body);
        auto text = stream->readAllText();
        return text.attach(kj::mv(stream))
            .then([id, status = response.statusCode](
                      kj::String body) -> kj::Own<AttachedOutput> {
              throw ApiError(kj::str("Failed to attach to container ",
                                     id.c_str()),
                             status, std::string(body.begin(), body.size()));
            });
      });
}

kj::Promise<void> Client::Start(const std::string& id) {
  return Call(kj::HttpMethod::POST,
              kj::str("/containers/", id.c_str(), "/start"))
      .then([id](Reply reply) {
        // 304: already started.
        if (reply.status != 204 && reply.status != 304) {
          throw ApiError(kj::str("Failed to start container ", id.c_str()),
                         reply.status, reply.body);
        }
      });
}

kj::Promise<kj::Maybe<int64_t>> Client::Wait(const std::string& id) {
  return Call(kj::HttpMethod::POST,
              kj::str("/containers/", id.c_str(), "/wait"))
      .then([id](Reply reply) -> kj::Maybe<int64_t> {
        if (reply.status != 200) {
          throw ApiError(kj::str("Failed to wait for container ", id.c_str()),
                         reply.status, reply.body);
        }
        util::JsonDocument doc(reply.body.c_str());
        auto status = util::GetField(doc.Root(), "StatusCode");
        KJ_IF_MAYBE(s, status) {
          if (s->isNumber()) return static_cast<int64_t>(s->getNumber());
        }
        return nullptr;
      });
}

kj::Promise<void> Client::Remove(const std::string& id) {
  return Call(kj::HttpMethod::DELETE,
              kj::str("/containers/", id.c_str(), "?force=1"))
      .then([id](Reply reply) {
        if (reply.status != 204) {
          throw ApiError(kj::str("Failed to remove container ", id.c_str()),
                         reply.status, reply.body);
        }
      });
}

}  // namespace docker
