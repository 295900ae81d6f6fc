#ifndef SERVER_EXECUTOR_HPP
#define SERVER_EXECUTOR_HPP

#include <kj/async.h>
#include <kj/timer.h>
#include <cstdint>
#include <string>

#include "docker/runtime.hpp"
#include "server/languages.hpp"

namespace server {

// Limits applied to every run.
struct ExecutionLimits {
  int64_t timeout_millis = 10000;
  int32_t cpu_shares = 512;
  uint32_t memory_bytes = 256 * 1024 * 1024;
};

// Runs programs in throw-away containers, one container per call.
class Executor {
 public:
  Executor(docker::ContainerRuntime* runtime, kj::Timer* timer,
           ExecutionLimits limits)
      : runtime_(*runtime), timer_(*timer), limits_(limits) {}
  KJ_DISALLOW_COPY(Executor);

  // Runs code with the interpreter of language and resolves with its combined
  // stdout and stderr as UTF-8 text, trimmed, whatever its exit status. Fails if any step
  // fails or if the program is still running after the timeout.
  // The container is removed before the returned promise settles. Dropping
  // the promise does not cancel the run: it still goes on until its
  // container is removed, so the Executor must outlive all runs.
  kj::Promise<std::string> Execute(const Language& language,
                                   std::string code);

 private:
  struct Run;

  kj::Promise<void> EnsureImage(const std::string& image);
  kj::Promise<std::string> RunContainer(Run* run);
  kj::Promise<kj::Maybe<int64_t>> WaitWithTimeout(const std::string& id);
  kj::Promise<void> Cleanup(Run* run);

  docker::ContainerRuntime& runtime_;
  kj::Timer& timer_;
  const ExecutionLimits limits_;
};

}  // namespace server

#endif
