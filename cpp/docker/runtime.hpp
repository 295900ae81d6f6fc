#ifndef DOCKER_RUNTIME_HPP
#define DOCKER_RUNTIME_HPP

#include <kj/async.h>
#include <cstdint>
#include <string>
#include <vector>

namespace docker {

// What to create: a container that runs command in image, with its output
// attachable and the given resource limits.
struct ContainerSpec {
  std::string image;
  std::vector<std::string> command;
  int32_t cpu_shares = 0;
  uint32_t memory_bytes = 0;
  std::string network_mode = "none";
};

// Combined stdout/stderr of an attached container.
class AttachedOutput {
 public:
  virtual ~AttachedOutput() = default;

  // Resolves with everything the container wrote once its output is closed,
  // which happens when the container exits. Must be called at most once.
  virtual kj::Promise<std::string> Collect() = 0;
};

// The operations of a container runtime needed to run a program once.
// Isolation and resource enforcement are entirely up to the implementation.
class ContainerRuntime {
 public:
  virtual ~ContainerRuntime() = default;

  // Resolves to true if image is available locally.
  virtual kj::Promise<bool> HasImage(const std::string& image) = 0;

  // Resolves once the pull of image has completed successfully.
  virtual kj::Promise<void> PullImage(const std::string& image) = 0;

  // Creates (but does not start) a container, resolving to its id.
  virtual kj::Promise<std::string> CreateContainer(
      const ContainerSpec& spec) = 0;

  // Resolves once the output of the container is attached.
  virtual kj::Promise<kj::Own<AttachedOutput>> Attach(
      const std::string& id) = 0;

  virtual kj::Promise<void> Start(const std::string& id) = 0;

  // Resolves when the container stops, with its exit status if the runtime
  // reported one.
  virtual kj::Promise<kj::Maybe<int64_t>> Wait(const std::string& id) = 0;

  // Removes the container, killing it first if it is still running.
  virtual kj::Promise<void> Remove(const std::string& id) = 0;
};

}  // namespace docker

#endif
