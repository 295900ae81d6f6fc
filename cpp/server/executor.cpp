#include "server/executor.hpp"

#include <kj/debug.h>

#include "util/misc.hpp"

namespace server {

struct Executor::Run {
  docker::ContainerSpec spec;
  kj::Maybe<std::string> id;
  // Output of the container, read as soon as it is attached so that the
  // program never blocks on a full pipe.
  kj::Maybe<kj::Promise<std::string>> output;
};

kj::Promise<std::string> Executor::Execute(const Language& language,
                                           std::string code) {
  KJ_LOG(INFO, "Attempting to run code", language.name, language.image);
  auto run = kj::heap<Run>();
  run->spec.image = language.image;
  run->spec.command = language.Command(code);
  run->spec.cpu_shares = limits_.cpu_shares;
  run->spec.memory_bytes = limits_.memory_bytes;
  run->spec.network_mode = "none";

  auto result = kj::newPromiseAndFulfiller<std::string>();
  auto& fulfiller = *result.fulfiller;
  Run* r = run.get();
  RunContainer(r)
      .then(
          [this, r](std::string output) {
            return Cleanup(r).then([output]() { return output; });
          },
          [this, r](kj::Exception exc) {
            KJ_LOG(ERROR, "Error during code execution", exc);
            return Cleanup(r).then(
                [exc = kj::mv(exc)]() mutable -> kj::Promise<std::string> {
                  return kj::mv(exc);
                });
          })
      .then(
          [&fulfiller](std::string output) {
            fulfiller.fulfill(kj::mv(output));
          },
          [&fulfiller](kj::Exception exc) { fulfiller.reject(kj::mv(exc)); })
      .attach(kj::mv(run), kj::mv(result.fulfiller))
      .detach([](kj::Exception exc) {
        KJ_LOG(ERROR, "Failed to report the result of a run", exc);
      });
  return kj::mv(result.promise);
}

kj::Promise<void> Executor::EnsureImage(const std::string& image) {
  KJ_LOG(INFO, "Checking for image", image);
  return runtime_.HasImage(image).then(
      [this, image](bool present) -> kj::Promise<void> {
        if (present) {
          KJ_LOG(INFO, "Image found locally", image);
          return kj::READY_NOW;
        }
        KJ_LOG(INFO, "Image not found locally, pulling", image);
        return runtime_.PullImage(image).then(
            [image]() { KJ_LOG(INFO, "Image pulled successfully", image); });
      });
}

kj::Promise<std::string> Executor::RunContainer(Run* run) {
  return EnsureImage(run->spec.image)
      .then([this, run]() { return runtime_.CreateContainer(run->spec); })
      .then([this, run](std::string id) {
        run->id = id;
        return runtime_.Attach(id);
      })
      .then([this, run](kj::Own<docker::AttachedOutput> attached) {
        auto& output = *attached;
        run->output = output.Collect()
                          .attach(kj::mv(attached))
                          .eagerlyEvaluate(nullptr);
        return runtime_.Start(KJ_ASSERT_NONNULL(run->id));
      })
      .then([this, run]() {
        const std::string& id = KJ_ASSERT_NONNULL(run->id);
        KJ_LOG(INFO, "Container started", util::shortId(id));
        return WaitWithTimeout(id);
      })
      .then([run](kj::Maybe<int64_t> status) -> kj::Promise<std::string> {
        KJ_IF_MAYBE(code, status) {
          KJ_LOG(INFO, "Container finished with status code", *code);
        } else {
          return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                               kj::str("Execution timed out."));
        }
        auto output = kj::mv(KJ_ASSERT_NONNULL(run->output));
        run->output = nullptr;
        return output.then([](std::string combined) {
          return util::trim(util::toValidUtf8(combined));
        });
      });
}

kj::Promise<kj::Maybe<int64_t>> Executor::WaitWithTimeout(
    const std::string& id) {
  // A null status, from the runtime or from the timer, means the program did
  // not finish in time.
  return runtime_.Wait(id).exclusiveJoin(
      timer_.afterDelay(limits_.timeout_millis * kj::MILLISECONDS)
          .then([id]() -> kj::Maybe<int64_t> {
            KJ_LOG(WARNING, "Timeout expired", util::shortId(id));
            return nullptr;
          }));
}

kj::Promise<void> Executor::Cleanup(Run* run) {
  // Stop reading before the container goes away.
  run->output = nullptr;
  KJ_IF_MAYBE(id, run->id) {
    std::string container = *id;
    return runtime_.Remove(container)
        .then(
            [container]() {
              KJ_LOG(INFO, "Container removed", util::shortId(container));
            },
            [container](kj::Exception exc) {
              KJ_LOG(ERROR, "Error removing container",
                     util::shortId(container), exc);
            });
  }
  return kj::READY_NOW;
}

}  // namespace server
