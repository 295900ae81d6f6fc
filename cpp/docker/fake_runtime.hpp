#ifndef DOCKER_FAKE_RUNTIME_HPP
#define DOCKER_FAKE_RUNTIME_HPP

#include <kj/async.h>
#include <kj/debug.h>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "docker/runtime.hpp"

namespace docker {

// In-memory ContainerRuntime for tests. Containers "run" a program function
// that maps their spec to the output they produce.
class FakeRuntime : public ContainerRuntime {
 public:
  enum class Mode {
    EXIT,         // Containers exit with status 0 as soon as they start.
    MANUAL,       // Containers exit when Exit() is called.
    HANG,         // Containers never exit.
    NULL_STATUS,  // Containers exit, but Wait reports no status.
  };

  kj::Promise<bool> HasImage(const std::string& image) override {
    calls.push_back("HasImage " + image);
    if (failing.count("HasImage")) return Error("HasImage");
    return images.count(image) > 0;
  }

  kj::Promise<void> PullImage(const std::string& image) override {
    calls.push_back("PullImage " + image);
    if (failing.count("PullImage") || !registry.count(image)) {
      return Error("Failed to pull image " + image);
    }
    images.insert(image);
    return kj::READY_NOW;
  }

  kj::Promise<std::string> CreateContainer(const ContainerSpec& spec) override {
    calls.push_back("CreateContainer " + spec.image);
    if (failing.count("CreateContainer")) return Error("CreateContainer");
    if (!images.count(spec.image)) return Error("No such image: " + spec.image);
    std::string id = "c0ffee" + std::to_string(next_id_++) + "0123456789abcdef";
    containers.emplace(id, kj::heap<Container>(spec));
    created.push_back(id);
    return id;
  }

  kj::Promise<kj::Own<AttachedOutput>> Attach(const std::string& id) override {
    calls.push_back("Attach " + id);
    if (failing.count("Attach")) return Error("Attach");
    auto& container = Get(id);
    kj::Own<AttachedOutput> output = kj::heap<Output>(
        container.exited.addBranch(), program(container.spec));
    return kj::mv(output);
  }

  kj::Promise<void> Start(const std::string& id) override {
    calls.push_back("Start " + id);
    if (failing.count("Start")) return Error("Start");
    auto& container = Get(id);
    container.started = true;
    if (mode == Mode::EXIT) container.exit->fulfill(int64_t(0));
    if (mode == Mode::NULL_STATUS) container.exit->fulfill(nullptr);
    return kj::READY_NOW;
  }

  kj::Promise<kj::Maybe<int64_t>> Wait(const std::string& id) override {
    calls.push_back("Wait " + id);
    if (failing.count("Wait")) return Error("Wait");
    return Get(id).exited.addBranch();
  }

  kj::Promise<void> Remove(const std::string& id) override {
    calls.push_back("Remove " + id);
    if (failing.count("Remove")) return Error("Remove");
    auto it = containers.find(id);
    if (it == containers.end()) return Error("No such container: " + id);
    // Killed.
    if (it->second->exit->isWaiting()) it->second->exit->fulfill(int64_t(137));
    containers.erase(it);
    return kj::READY_NOW;
  }

  // Makes a container started in MANUAL mode exit.
  void Exit(const std::string& id, int64_t status = 0) {
    Get(id).exit->fulfill(kj::Maybe<int64_t>(status));
  }

  // Id of the only live container created from image.
  std::string IdOf(const std::string& image) {
    for (const auto& container : containers) {
      if (container.second->spec.image == image) return container.first;
    }
    KJ_FAIL_ASSERT("No container for image", image);
  }

  bool Started(const std::string& id) { return Get(id).started; }

  Mode mode = Mode::EXIT;
  std::set<std::string> images;
  std::set<std::string> registry;
  std::set<std::string> failing;
  std::function<std::string(const ContainerSpec&)> program =
      [](const ContainerSpec& spec) {
        return "\n" + spec.command.back() + "\n";
      };

  std::vector<std::string> calls;
  std::vector<std::string> created;

  struct Container {
    explicit Container(
        ContainerSpec spec,
        kj::PromiseFulfillerPair<kj::Maybe<int64_t>> pair =
            kj::newPromiseAndFulfiller<kj::Maybe<int64_t>>())
        : spec(std::move(spec)),
          exit(kj::mv(pair.fulfiller)),
          exited(pair.promise.fork()) {}

    ContainerSpec spec;
    bool started = false;
    kj::Own<kj::PromiseFulfiller<kj::Maybe<int64_t>>> exit;
    kj::ForkedPromise<kj::Maybe<int64_t>> exited;
  };
  // Containers that have been created and not removed yet.
  std::map<std::string, kj::Own<Container>> containers;

 private:
  class Output : public AttachedOutput {
   public:
    Output(kj::Promise<kj::Maybe<int64_t>> exited, std::string output)
        : exited_(kj::mv(exited)), output_(kj::mv(output)) {}
    kj::Promise<std::string> Collect() override {
      return exited_.then(
          [this](kj::Maybe<int64_t>) { return output_; });
    }

   private:
    kj::Promise<kj::Maybe<int64_t>> exited_;
    std::string output_;
  };

  static kj::Exception Error(const std::string& what) {
    return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                         kj::str(what.c_str()));
  }

  Container& Get(const std::string& id) {
    auto it = containers.find(id);
    KJ_ASSERT(it != containers.end(), "No such container", id);
    return *it->second;
  }

  size_t next_id_ = 1;
};

}  // namespace docker

#endif
